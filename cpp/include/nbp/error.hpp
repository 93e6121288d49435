#pragma once

#include <stdexcept>
#include <string>

namespace nbp {

/**
 * Error reporting for the neighbor subsystem.
 *
 * Every failure is unrecoverable at this layer and surfaces to the caller as
 * an NbpException subclass carrying a code, the detecting function and an
 * optional hint for fixing the input.
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Geometry / setup errors
    CONFIGURATION_ERROR = 100,

    // Indexing errors
    BOUNDS_ERROR = 200,

    // Lookup errors
    QUERY_ERROR = 300
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT:    return "invalid argument";
        case ErrorCode::CONFIGURATION_ERROR: return "configuration error";
        case ErrorCode::BOUNDS_ERROR:        return "bounds error";
        case ErrorCode::QUERY_ERROR:         return "query error";
    }
    return "unknown error";
}

class NbpException : public std::runtime_error {
public:
    explicit NbpException(ErrorCode code, const std::string& message,
                          const std::string& context = "",
                          const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string("nbp ") + error_code_name(code) + " ["
                           + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public NbpException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : NbpException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Box, cutoff or skin radius that cannot produce a valid 3x3x3 stencil
class ConfigurationError : public NbpException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : NbpException(ErrorCode::CONFIGURATION_ERROR, message, context, suggestion) {}
};

// Position that does not map into the subcell grid after periodic wrapping
class BoundsError : public NbpException {
public:
    explicit BoundsError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : NbpException(ErrorCode::BOUNDS_ERROR, message, context, suggestion) {}
};

// Neighbor lookup for a particle id the cache does not hold
class QueryError : public NbpException {
public:
    explicit QueryError(const std::string& message,
                        const std::string& context = "",
                        const std::string& suggestion = "")
        : NbpException(ErrorCode::QUERY_ERROR, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_configuration(bool condition, const std::string& message,
                                    const std::string& context = "",
                                    const std::string& suggestion = "") {
        if (!condition) {
            throw ConfigurationError(message, context, suggestion);
        }
    }
};

#define NBP_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw nbp::InvalidArgumentError(message, __func__); } while (0)

#define NBP_CHECK_CONFIG(condition, message, suggestion) \
    nbp::ErrorHandler::check_configuration(condition, message, __func__, suggestion)

} // namespace nbp
