#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "booking/BookingOrchestrator.h"
#include "session/Command.h"

/**
 * Command loop around one BookingOrchestrator.
 *
 * Reads commands line by line, applies them and writes the rendered result
 * lines. Malformed lines are logged and skipped; Quit() ends the session.
 */
class BookingSession {
public:
    struct Stats {
        uint32_t linesRead{0};
        uint32_t commandsExecuted{0};
        uint32_t linesRejected{0};
        bool terminated{false}; ///< Quit() was reached
    };

    BookingSession(std::istream &input, std::ostream &output,
                   bool flushEachCommand = true, bool echoCommands = false);

    /** Process the whole input stream. */
    Stats run();

    /**
     * Process a single line.
     * @return false once Quit() has been processed
     */
    bool processLine(const std::string &line);

    /** Apply a parsed command (other than Quit) to the orchestrator. */
    BookingResult dispatch(const Command &command);

    const Stats &stats() const { return stats_; }
    const BookingOrchestrator &orchestrator() const { return orchestrator_; }

private:
    static constexpr auto tag_{"Session"};

    std::istream &input_;
    std::ostream &output_;
    bool flushEachCommand_;
    bool echoCommands_;
    BookingOrchestrator orchestrator_;
    Stats stats_;

    void writeLine(const std::string &line);
};
