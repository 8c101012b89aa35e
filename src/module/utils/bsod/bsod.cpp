#include <bsod/bsod.h>

#include <logging/log.hpp>

#include <array>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

LOG_COMPONENT_DEF(BSOD, logging::Severity::critical);

extern "C" void _bsod(const char *fmt, const char *file_name, int line_number, ...) {
    std::array<char, 256> buffer;
    va_list args;
    va_start(args, line_number);
    vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    log_critical(BSOD, "%s:%d: %s", file_name, line_number, buffer.data());
    std::abort();
}
