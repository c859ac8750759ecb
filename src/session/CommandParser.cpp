#include "session/CommandParser.h"

#include <cctype>
#include <utility>
#include <vector>

#include "utils/ArgumentParser.h"

namespace {
    struct VerbDef {
        const char *name;
        CommandType type;
        uint32_t arity;
    };

    constexpr VerbDef VERBS[] = {
        {"Initialize", CommandType::INITIALIZE, 1},
        {"Available", CommandType::AVAILABLE, 0},
        {"Reserve", CommandType::RESERVE, 2},
        {"Cancel", CommandType::CANCEL, 2},
        {"ExitWaitlist", CommandType::EXIT_WAITLIST, 1},
        {"UpdatePriority", CommandType::UPDATE_PRIORITY, 2},
        {"AddSeats", CommandType::ADD_SEATS, 1},
        {"PrintReservations", CommandType::PRINT_RESERVATIONS, 0},
        {"ReleaseSeats", CommandType::RELEASE_SEATS, 2},
        {"Quit", CommandType::QUIT, 0},
    };

    std::string trim(const std::string &s) {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(begin, end - begin);
    }

    const VerbDef *findVerb(const std::string &name) {
        for (const VerbDef &def : VERBS) {
            if (name == def.name) {
                return &def;
            }
        }
        return nullptr;
    }

    std::vector<std::string> splitArgs(const std::string &inner) {
        std::vector<std::string> parts;
        if (trim(inner).empty()) {
            return parts;
        }
        size_t start = 0;
        while (true) {
            const size_t comma = inner.find(',', start);
            parts.push_back(trim(inner.substr(start, comma == std::string::npos ? std::string::npos
                                                                                : comma - start)));
            if (comma == std::string::npos) {
                break;
            }
            start = comma + 1;
        }
        return parts;
    }

    ParseResult fail(std::string reason) {
        ParseResult result;
        result.status = ParseResult::Status::ERROR;
        result.error = std::move(reason);
        return result;
    }
}

namespace CommandParser {
    ParseResult parse(const std::string &line) {
        const std::string text = trim(line);
        if (text.empty()) {
            return ParseResult{};
        }

        const size_t open = text.find('(');
        if (open == std::string::npos || text.back() != ')') {
            return fail("expected Verb(args): " + text);
        }
        const size_t close = text.size() - 1;
        if (text.find('(', open + 1) != std::string::npos || text.find(')') != close) {
            return fail("unbalanced parentheses: " + text);
        }

        const std::string verb = trim(text.substr(0, open));
        const VerbDef *def = findVerb(verb);
        if (def == nullptr) {
            return fail("unknown command: " + verb);
        }

        const std::vector<std::string> parts = splitArgs(text.substr(open + 1, close - open - 1));
        if (parts.size() != def->arity) {
            return fail(verb + " expects " + std::to_string(def->arity) + " argument(s), got " +
                        std::to_string(parts.size()));
        }

        ParseResult result;
        result.status = ParseResult::Status::OK;
        result.command = Command{def->type};
        result.command.argCount = def->arity;
        for (uint32_t i = 0; i < def->arity; ++i) {
            if (!ArgumentParser::parseInt32(parts[i].c_str(), result.command.args[i])) {
                return fail(verb + ": invalid integer argument '" + parts[i] + "'");
            }
        }
        return result;
    }

    const char *verbName(CommandType type) {
        for (const VerbDef &def : VERBS) {
            if (def.type == type) {
                return def.name;
            }
        }
        return "?";
    }
}
