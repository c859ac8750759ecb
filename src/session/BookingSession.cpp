#include "session/BookingSession.h"

#include <stdexcept>

#include "logging/Logger.h"
#include "session/CommandParser.h"
#include "session/ResultFormatter.h"

namespace {
    constexpr auto SRC = Logger::Source::Session;
}

BookingSession::BookingSession(std::istream &input, std::ostream &output,
                               bool flushEachCommand, bool echoCommands)
    : input_{input},
      output_{output},
      flushEachCommand_{flushEachCommand},
      echoCommands_{echoCommands},
      orchestrator_{},
      stats_{} {
}

BookingSession::Stats BookingSession::run() {
    std::string line;
    while (!stats_.terminated && std::getline(input_, line)) {
        processLine(line);
    }
    if (input_.bad()) {
        Logger::error(SRC, tag_, "Input stream failed after %u lines", stats_.linesRead);
    }
    output_.flush();
    return stats_;
}

bool BookingSession::processLine(const std::string &line) {
    if (stats_.terminated) {
        return false;
    }
    ++stats_.linesRead;

    const ParseResult parsed = CommandParser::parse(line);
    switch (parsed.status) {
        case ParseResult::Status::BLANK:
            return true;
        case ParseResult::Status::ERROR:
            ++stats_.linesRejected;
            Logger::warn(SRC, tag_, "Line %u skipped: %s", stats_.linesRead, parsed.error.c_str());
            return true;
        case ParseResult::Status::OK:
            break;
    }

    const Command &command = parsed.command;
    if (echoCommands_) {
        Logger::info(SRC, tag_, "Line %u: %s", stats_.linesRead, CommandParser::verbName(command.type));
    }

    if (command.type == CommandType::QUIT) {
        writeLine(ResultFormatter::terminationLine());
        stats_.terminated = true;
        output_.flush();
        return false;
    }

    const BookingResult result = dispatch(command);
    ++stats_.commandsExecuted;
    Logger::debug(SRC, tag_, "%s -> %s", CommandParser::verbName(command.type), toString(result.outcome));
    for (const std::string &out : ResultFormatter::format(result)) {
        writeLine(out);
    }
    if (flushEachCommand_) {
        output_.flush();
    }
    return true;
}

BookingResult BookingSession::dispatch(const Command &command) {
    const int32_t a = command.args[0];
    const int32_t b = command.args[1];

    switch (command.type) {
        case CommandType::INITIALIZE: return orchestrator_.initialize(a);
        case CommandType::AVAILABLE: return orchestrator_.available();
        case CommandType::RESERVE: return orchestrator_.reserve(a, b);
        case CommandType::CANCEL: return orchestrator_.cancel(a, b);
        case CommandType::EXIT_WAITLIST: return orchestrator_.exitWaitlist(a);
        case CommandType::UPDATE_PRIORITY: return orchestrator_.updatePriority(a, b);
        case CommandType::ADD_SEATS: return orchestrator_.addSeats(a);
        case CommandType::PRINT_RESERVATIONS: return orchestrator_.printReservations();
        case CommandType::RELEASE_SEATS: return orchestrator_.releaseSeats(a, b);
        case CommandType::QUIT:
            break;
    }
    throw std::invalid_argument(std::string("Command cannot be dispatched: ") +
                                CommandParser::verbName(command.type));
}

void BookingSession::writeLine(const std::string &line) {
    output_ << line << '\n';
    if (!output_) {
        throw std::runtime_error("Output stream write failed");
    }
}
