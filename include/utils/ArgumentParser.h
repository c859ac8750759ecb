#pragma once

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstdint>
#include <cstdio>
#include <string>
#include <unistd.h>

/**
 * @brief Command-line and argument parsing utilities.
 *
 * Provides type-safe integer parsing shared by the entry point and the
 * command parser, plus validation of the booking program arguments.
 */
namespace ArgumentParser {
    namespace detail {
        /**
         * @brief Write error message to stderr.
         * @param msg Error message to display
         */
        inline void err(const char *msg) {
            char buf[256];
            int n = snprintf(buf, sizeof(buf), "Error: %s\n", msg);
            if (n > 0) write(STDERR_FILENO, buf, static_cast<size_t>(n));
        }

        /**
         * @brief Write usage message to stderr.
         * @param program Program name (argv[0])
         * @param args Expected arguments description
         */
        inline void usage(const char *program, const char *args) {
            char buf[256];
            int n = snprintf(buf, sizeof(buf), "Usage: %s %s\n", program, args);
            if (n > 0) write(STDERR_FILENO, buf, static_cast<size_t>(n));
        }
    }

    /**
     * @brief Parse string to int32_t.
     * @param str Input string (no surrounding whitespace)
     * @param out Output value
     * @return true if the whole string is a decimal integer in int32 range
     */
    inline bool parseInt32(const char *str, int32_t &out) {
        if (str == nullptr || *str == '\0') return false;
        char *end;
        errno = 0;
        long val = strtol(str, &end, 10);
        if (*end != '\0' || errno == ERANGE || val < INT32_MIN || val > INT32_MAX) return false;
        out = static_cast<int32_t>(val);
        return true;
    }

    /**
     * @brief Arguments for the booking program.
     */
    struct BookingArgs {
        std::string inputFile;  ///< Command file to execute
        std::string outputFile; ///< Empty when derived from the input name
    };

    /**
     * @brief Derive the output path from the input path.
     * @param inputFile Input path
     * @param suffix Suffix replacing the input extension
     *
     * "tests/run1.txt" -> "tests/run1<suffix>". Dots in directory names are
     * not treated as extensions.
     */
    inline std::string defaultOutputPath(const std::string &inputFile, const std::string &suffix) {
        const auto slash = inputFile.find_last_of('/');
        const auto dot = inputFile.find_last_of('.');
        if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
            return inputFile + suffix;
        }
        return inputFile.substr(0, dot) + suffix;
    }

    /**
     * @brief Parse command-line arguments for the booking program.
     * @param argc Argument count
     * @param argv Argument values
     * @param args Output BookingArgs structure
     * @return true if the arguments were accepted, false otherwise
     *
     * Expected: <input_file> [output_file]
     */
    inline bool parseBookingArgs(int argc, char *argv[], BookingArgs &args) {
        if (argc != 2 && argc != 3) {
            detail::usage(argv[0], "<input_file> [output_file]");
            return false;
        }
        args.inputFile = argv[1];
        if (args.inputFile.empty()) {
            detail::err("Empty input file name");
            return false;
        }
        args.outputFile = (argc == 3) ? argv[2] : "";
        if (argc == 3 && args.outputFile.empty()) {
            detail::err("Empty output file name");
            return false;
        }
        return true;
    }
}
