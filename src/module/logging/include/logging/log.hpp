/// @file
#pragma once

#include <cstdint>

namespace logging {

enum class Severity : uint8_t {
    debug = 1,
    info = 2,
    warning = 3,
    error = 4,
    critical = 5,
};

struct Component {
    /// Printed with every message of the component
    const char *name;

    /// Messages below this severity are dropped
    Severity lowest_severity;
};

void log_event(const Component &component, Severity severity, const char *fmt, ...) __attribute__((format(__printf__, 3, 4)));

} // namespace logging

/// Defines a log component; use once per component in a .cpp file
#define LOG_COMPONENT_DEF(name, severity) \
    logging::Component log_component_##name { #name, severity }

/// Makes a component defined in another translation unit available
#define LOG_COMPONENT_REF(name) \
    extern logging::Component log_component_##name

#define log_debug(component, fmt, ...)    logging::log_event(log_component_##component, logging::Severity::debug, fmt, ##__VA_ARGS__)
#define log_info(component, fmt, ...)     logging::log_event(log_component_##component, logging::Severity::info, fmt, ##__VA_ARGS__)
#define log_warning(component, fmt, ...)  logging::log_event(log_component_##component, logging::Severity::warning, fmt, ##__VA_ARGS__)
#define log_error(component, fmt, ...)    logging::log_event(log_component_##component, logging::Severity::error, fmt, ##__VA_ARGS__)
#define log_critical(component, fmt, ...) logging::log_event(log_component_##component, logging::Severity::critical, fmt, ##__VA_ARGS__)
