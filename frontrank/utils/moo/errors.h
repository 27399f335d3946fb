/* Error type raised by the ranking code. Every failure is reported before any
rank is written, so a caught rank_error means the population is untouched. */
#ifndef ERRORS_H
#define ERRORS_H

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace frontrank {

enum class error_code : int {
    invalid_input = 1, // inconsistent dimensions, bad violation, bad options
    internal = 2,      // front invariant broken
};

inline const char* to_string(error_code code) noexcept {
    switch (code) {
        case error_code::invalid_input: return "InvalidInput";
        case error_code::internal:      return "Internal";
        default:                        return "Unknown";
    }
}

class rank_error final : public std::runtime_error {
public:
    rank_error(error_code code, std::string message,
               const char* file, int line, const char* function)
        : std::runtime_error(build_what(code, message, file, line, function)),
          code_(code),
          message_(std::move(message)) {}

    error_code code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

private:
    static std::string build_what(error_code code, const std::string& msg,
                                  const char* file, int line, const char* func) {
        std::ostringstream oss;
        oss << "[frontrank " << to_string(code) << "] " << msg;
        if (file && *file) {
            oss << " @ " << file << ":" << line;
            if (func && *func) oss << " (" << func << ")";
        }
        return oss.str();
    }

    error_code code_;
    std::string message_;
};

[[noreturn]] inline void throw_error(error_code code, std::string message,
                                     const char* file, int line, const char* function) {
    throw rank_error(code, std::move(message), file, line, function);
}

inline void ensure(bool ok, error_code code, std::string message,
                   const char* file, int line, const char* function) {
    if (!ok) {
        throw_error(code, std::move(message), file, line, function);
    }
}

} // namespace frontrank

#define FRONTRANK_THROW(CODE, MSG) ::frontrank::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define FRONTRANK_ENSURE(EXPR, CODE, MSG) ::frontrank::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)

#endif // ERRORS_H
