/// @file
#include <logging/log.hpp>

#include <array>
#include <cstdarg>
#include <cstdio>
#include <utility>

namespace {

const char *severity_name(logging::Severity severity) {
    using S = logging::Severity;

    switch (severity) {

    case S::debug:
        return "DEBUG";

    case S::info:
        return "INFO";

    case S::warning:
        return "WARNING";

    case S::error:
        return "ERROR";

    case S::critical:
        return "CRITICAL";
    }

    std::unreachable();
}

} // namespace

void logging::log_event(const Component &component, Severity severity, const char *fmt, ...) {
    if (severity < component.lowest_severity) {
        return;
    }

    std::array<char, 256> buffer;
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    std::fprintf(stderr, "%s %s: %s\n", severity_name(severity), component.name, buffer.data());
}
