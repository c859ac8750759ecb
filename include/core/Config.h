#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

#include "core/Constants.h"

#ifndef BOOKING_PROJECT_DIR
#define BOOKING_PROJECT_DIR "."
#endif

/**
 * @brief Runtime configuration from environment variables.
 *
 * Call Config::loadEnvFile() before using config values.
 * For fixed values, see Constants.h.
 * For compile-time flags, see Flags.h.
 */
namespace Config {
    namespace Runtime {
        /**
         * @brief Get uint32 environment variable with default fallback.
         * @param envName Name of the environment variable
         * @param defaultValue Value to return if variable is not set
         * @return Parsed uint32 value or default
         * @throws std::invalid_argument If the value is not a number
         */
        inline uint32_t getEnvOr(const char *envName, uint32_t defaultValue) {
            const char *env = std::getenv(envName);
            if (!env) {
                return defaultValue;
            }
            return static_cast<uint32_t>(std::stoul(env));
        }

        /**
         * @brief Get boolean (0/1) environment variable with default fallback.
         * @throws std::invalid_argument If the value is neither 0 nor 1
         */
        inline bool getEnvBoolOr(const char *envName, bool defaultValue) {
            const uint32_t v = getEnvOr(envName, defaultValue ? 1 : 0);
            if (v > 1) {
                throw std::invalid_argument(std::string("Expected 0 or 1 for ") + envName);
            }
            return v == 1;
        }

        /**
         * @brief Get string environment variable with default fallback.
         * Empty values are treated as unset.
         */
        inline std::string getEnvStringOr(const char *envName, const char *defaultValue) {
            const char *env = std::getenv(envName);
            if (!env || env[0] == '\0') {
                return defaultValue;
            }
            return env;
        }
    }

    /**
     * @brief Load configuration from booking.env file.
     *
     * Reads key=value pairs from the env file and sets them as environment
     * variables. Existing environment variables are not overwritten.
     *
     * @return false if the env file does not exist (defaults are used)
     */
    inline bool loadEnvFile() {
        std::string path = std::string(BOOKING_PROJECT_DIR) + "/booking.env";
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#') {
                continue;
            }

            // Remove "export " prefix if present
            const std::string exportPrefix = "export ";
            if (line.compare(0, exportPrefix.size(), exportPrefix) == 0) {
                line = line.substr(exportPrefix.size());
            }

            auto eqPos = line.find('=');
            if (eqPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, eqPos);
            std::string value = line.substr(eqPos + 1);

            setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
        }
        return true;
    }

    /**
     * @brief Output file configuration.
     */
    namespace Output {
        /** @brief Suffix appended to the input stem when no output path is given */
        inline const std::string &FILE_SUFFIX() {
            static const std::string v = Runtime::getEnvStringOr("BOOKING_OUTPUT_SUFFIX",
                                                                 Constants::Output::DEFAULT_FILE_SUFFIX);
            return v;
        }

        /** @brief Flush the output stream after every command */
        inline bool FLUSH_EACH_COMMAND() {
            static const bool v = Runtime::getEnvBoolOr("BOOKING_FLUSH_EACH_COMMAND", true);
            return v;
        }
    }

    /**
     * @brief Session diagnostics.
     */
    namespace Session {
        /** @brief Log every parsed command at INFO level */
        inline bool ECHO_COMMANDS() {
            static const bool v = Runtime::getEnvBoolOr("BOOKING_ECHO_COMMANDS", false);
            return v;
        }
    }

    /**
     * @brief Validate all configuration values.
     *
     * Loads every value once so that malformed variables fail at startup
     * rather than in the middle of a session.
     *
     * @throws std::invalid_argument If any value is malformed
     */
    inline void validate() {
        Output::FILE_SUFFIX();
        Output::FLUSH_EACH_COMMAND();
        Session::ECHO_COMMANDS();
        // Logging flags are constexpr, no validation needed
    }
}
