#pragma once
#include <stdexcept>
#include <string>

namespace termai {

// Bad or missing search provider configuration. Raised before any network call.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class ProviderErrorKind { Http, Decode, Timeout };

// Search backend failure. The agent loop hands these back to the model
// as tool output instead of aborting.
class ProviderError : public std::runtime_error {
public:
    ProviderError(ProviderErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ProviderErrorKind kind() const { return kind_; }

private:
    ProviderErrorKind kind_;
};

enum class EngineErrorKind {
    MalformedToolCall,
    IterationLimitExceeded,
    Http,
    Decode,
    Timeout,
    UnsupportedTools
};

// Fatal failure of one engine invocation (model server or loop control).
class EngineError : public std::runtime_error {
public:
    EngineError(EngineErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    EngineErrorKind kind() const { return kind_; }

private:
    EngineErrorKind kind_;
};

} // namespace termai
