#pragma once
#include <stdexcept>
#include <string>

namespace sdp_assistant {

enum class ErrorKind {
    Validation,
    InvalidArchive,
    Configuration,
    Upstream,
    EmptyResponse,
    EmptyScript,
    Timeout,
    ToolNotFound
};

// Stable machine-readable category, used as "error_type" in envelopes
inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:     return "validation_error";
        case ErrorKind::InvalidArchive: return "invalid_archive";
        case ErrorKind::Configuration:  return "configuration_error";
        case ErrorKind::Upstream:       return "upstream_error";
        case ErrorKind::EmptyResponse:  return "empty_response";
        case ErrorKind::EmptyScript:    return "empty_script";
        case ErrorKind::Timeout:        return "timeout";
        case ErrorKind::ToolNotFound:   return "tool_not_found";
    }
    return "internal_error";
}

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public PipelineError {
public:
    explicit ValidationError(const std::string& message)
        : PipelineError(ErrorKind::Validation, message) {}
};

class InvalidArchiveError : public PipelineError {
public:
    explicit InvalidArchiveError(const std::string& message)
        : PipelineError(ErrorKind::InvalidArchive, message) {}
};

class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message)
        : PipelineError(ErrorKind::Configuration, message) {}
};

class UpstreamError : public PipelineError {
public:
    UpstreamError(const std::string& message, long status_code = 0)
        : PipelineError(ErrorKind::Upstream, message), status_code_(status_code) {}

    // 0 when the request never got an HTTP response
    long status_code() const noexcept { return status_code_; }

private:
    long status_code_;
};

class EmptyResponseError : public PipelineError {
public:
    explicit EmptyResponseError(const std::string& message)
        : PipelineError(ErrorKind::EmptyResponse, message) {}
};

class EmptyScriptError : public PipelineError {
public:
    explicit EmptyScriptError(const std::string& message)
        : PipelineError(ErrorKind::EmptyScript, message) {}
};

class TimeoutError : public PipelineError {
public:
    TimeoutError(const std::string& message, int timeout_seconds)
        : PipelineError(ErrorKind::Timeout, message), timeout_seconds_(timeout_seconds) {}

    int timeout_seconds() const noexcept { return timeout_seconds_; }

private:
    int timeout_seconds_;
};

class ToolNotFoundError : public PipelineError {
public:
    explicit ToolNotFoundError(const std::string& message)
        : PipelineError(ErrorKind::ToolNotFound, message) {}
};

} // namespace sdp_assistant
