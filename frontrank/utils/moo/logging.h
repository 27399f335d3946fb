/* Shared spdlog logger for the ranking code. Created on first use; if the
host application already registered a logger named "frontrank" that one is
reused, so callers can redirect output before ranking anything. */
#ifndef LOGGING_H
#define LOGGING_H

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace frontrank {

inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        std::shared_ptr<spdlog::logger> existing = spdlog::get("frontrank");
        return existing ? existing : spdlog::stderr_color_mt("frontrank");
    }();
    return instance;
}

} // namespace frontrank

#endif // LOGGING_H
