#include "core/Config.h"
#include "logging/Logger.h"
#include "session/BookingSession.h"
#include "utils/ArgumentParser.h"
#include <fstream>
#include <iostream>

namespace {
    constexpr const char *TAG = "Main";
    constexpr auto SRC = Logger::Source::Other;
}

int main(int argc, char *argv[]) {
    ArgumentParser::BookingArgs args;
    if (!ArgumentParser::parseBookingArgs(argc, argv, args)) {
        return 1;
    }

    try {
        if (!Config::loadEnvFile()) {
            Logger::debug(SRC, TAG, "No booking.env found, using defaults");
        }
        Config::validate();
    } catch (const std::exception &e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    const std::string outputPath = args.outputFile.empty()
                                       ? ArgumentParser::defaultOutputPath(args.inputFile,
                                                                           Config::Output::FILE_SUFFIX())
                                       : args.outputFile;

    std::ifstream input(args.inputFile);
    if (!input.is_open()) {
        Logger::perror(SRC, TAG, ("Cannot open input " + args.inputFile).c_str());
        return 1;
    }
    std::ofstream output(outputPath);
    if (!output.is_open()) {
        Logger::perror(SRC, TAG, ("Cannot open output " + outputPath).c_str());
        return 1;
    }

    try {
        BookingSession session(input, output,
                               Config::Output::FLUSH_EACH_COMMAND(),
                               Config::Session::ECHO_COMMANDS());
        const BookingSession::Stats stats = session.run();
        Logger::info(SRC, TAG, "%u commands executed, %u lines rejected -> %s",
                     stats.commandsExecuted, stats.linesRejected, outputPath.c_str());
    } catch (const std::exception &e) {
        Logger::error(SRC, TAG, "Session aborted: %s", e.what());
        return 1;
    }
    return 0;
}
