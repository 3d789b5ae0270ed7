#ifndef LOGSKETCH_TRACEABLEEXCEPTION_HPP
#define LOGSKETCH_TRACEABLEEXCEPTION_HPP

#include <exception>
#include <string>
#include <utility>

#include "Defs.hpp"
#include "ErrorCode.hpp"

namespace logsketch {
/**
 * Base class for every exception thrown by logsketch. Records the error code and the place the
 * exception was thrown from.
 */
class TraceableException : public std::exception {
public:
    // Constructors
    TraceableException(ErrorCode error_code, char const* const filename, int line_number)
            : m_error_code(error_code),
              m_filename(filename),
              m_line_number(line_number) {}

    // Methods
    [[nodiscard]] auto get_error_code() const -> ErrorCode { return m_error_code; }

    [[nodiscard]] auto get_filename() const -> char const* { return m_filename; }

    [[nodiscard]] auto get_line_number() const -> int { return m_line_number; }

    [[nodiscard]] auto what() const noexcept -> char const* override {
        return "TraceableException";
    }

private:
    ErrorCode m_error_code;
    char const* m_filename;
    int m_line_number;
};

/**
 * Thrown when a sketch or its configuration is constructed with parameters outside their
 * supported range. The object is never created.
 */
class ConfigurationError : public TraceableException {
public:
    ConfigurationError(char const* const filename, int line_number, std::string message)
            : TraceableException(ErrorCodeBadParam, filename, line_number),
              m_message(std::move(message)) {}

    [[nodiscard]] auto what() const noexcept -> char const* override { return m_message.c_str(); }

private:
    std::string m_message;
};

/**
 * Thrown when a bit index falls outside a BitSet. Indicates a hashing bug, never a runtime
 * condition callers are expected to recover from.
 */
class IndexError : public TraceableException {
public:
    IndexError(char const* const filename, int line_number, std::string message)
            : TraceableException(ErrorCodeOutOfBounds, filename, line_number),
              m_message(std::move(message)) {}

    [[nodiscard]] auto what() const noexcept -> char const* override { return m_message.c_str(); }

private:
    std::string m_message;
};
}  // namespace logsketch

#endif  // LOGSKETCH_TRACEABLEEXCEPTION_HPP
