#include "logging.hpp"
#include <cstdarg>
#include <cstdio>
#include <iostream>

namespace InkLog {

    void Print(char level, const char* tag, const char* fmt, ...) {
        char message[1024];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(message, sizeof(message), fmt, args);
        va_end(args);

        // One write per line so lines from parallel workers do not interleave.
        char line[1100];
        std::snprintf(line, sizeof(line), "%c [%s] %s\n", level, tag, message);
        std::cerr << line << std::flush;
    }

}
