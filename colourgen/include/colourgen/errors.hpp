#ifndef COLOURGEN_ERRORS_HPP
#define COLOURGEN_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace colourgen {

/**
 * Reasons a colour source could not be resolved.
 * None of these reach the caller of make_palette; they are recorded on the
 * Palette when a fallback happened.
 */
enum class FailureKind {
    ClassificationMismatch,  // Descriptor is not the shape this strategy handles
    SourceUnavailable,       // Network, file or image fetch failed
    MalformedSource,         // Colour data could not be parsed
    UnknownName              // Name matches no ramp, table entry or resource
};

inline const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::ClassificationMismatch: return "ClassificationMismatch";
        case FailureKind::SourceUnavailable: return "SourceUnavailable";
        case FailureKind::MalformedSource: return "MalformedSource";
        case FailureKind::UnknownName: return "UnknownName";
        default: return "Unknown";
    }
}

struct Failure {
    FailureKind kind;
    std::string message;

    std::string to_string() const {
        return std::string(failure_kind_name(kind)) + ": " + message;
    }
};

// Exception types thrown by the low-level components (transport, decoders,
// parsers). Strategies convert them into Failure values at their boundary.
class ColourgenException : public std::runtime_error {
public:
    ColourgenException(FailureKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FailureKind kind() const noexcept { return kind_; }

    Failure to_failure() const { return Failure{kind_, what()}; }

private:
    FailureKind kind_;
};

class SourceUnavailableError : public ColourgenException {
public:
    explicit SourceUnavailableError(const std::string& message)
        : ColourgenException(FailureKind::SourceUnavailable, message) {}
};

class MalformedSourceError : public ColourgenException {
public:
    explicit MalformedSourceError(const std::string& message)
        : ColourgenException(FailureKind::MalformedSource, message) {}
};

class UnknownNameError : public ColourgenException {
public:
    explicit UnknownNameError(const std::string& message)
        : ColourgenException(FailureKind::UnknownName, message) {}
};

// Fatal: the bundled dataset could not be loaded. This is the only error
// make_palette lets through.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * Value-or-failure returned by every strategy.
 */
template<typename T>
class Result {
private:
    std::variant<T, Failure> data_;

public:
    Result(T value) : data_(std::move(value)) {}
    Result(Failure failure) : data_(std::move(failure)) {}

    static Result failure(FailureKind kind, std::string message) {
        return Result(Failure{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const Failure& error() const { return std::get<Failure>(data_); }

    // Value on success, otherwise whatever the fallback produces
    template<typename F>
    T or_else(F&& fallback) const {
        if (ok()) {
            return value();
        }
        return fallback(error());
    }
};

} // namespace colourgen

#endif // COLOURGEN_ERRORS_HPP
