#include "logging/Logger.h"

namespace Logger {
    namespace detail {
        bool colorEnabled() {
            static const bool enabled = isatty(STDERR_FILENO) == 1;
            return enabled;
        }

        void emit(const char *buf, size_t len) {
            while (len > 0) {
                ssize_t written = write(STDERR_FILENO, buf, len);
                if (written < 0) {
                    if (errno == EINTR) continue;
                    // stderr is gone; nowhere left to report it
                    return;
                }
                buf += written;
                len -= static_cast<size_t>(written);
            }
        }
    }
}
