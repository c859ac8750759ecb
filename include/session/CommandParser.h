#pragma once

#include <string>

#include "session/Command.h"

/**
 * @brief Text command parsing.
 *
 * Accepts lines of the form Verb(arg, arg). Whitespace around the line and
 * around each argument is ignored; verbs are case-sensitive.
 */
namespace CommandParser {
    /**
     * @brief Parse one input line.
     * @param line Raw input line (may include a trailing '\r')
     * @return OK with the command, BLANK for empty lines, or ERROR with a reason
     */
    ParseResult parse(const std::string &line);

    /** @brief Canonical verb of a command type (e.g. "Reserve"). */
    const char *verbName(CommandType type);
}
