#pragma once

#include <string>
#include <utility>

enum class ErrorKind {
    None               = 0,
    InvalidParameters  = 1,  // rejected before any work starts
    ComputationFailure = 2,  // fault inside a batch; the job is Failed
    ExportFailure      = 3,  // encoding failed; render state untouched
};

// Empty (kind None) on success, otherwise a kind plus a human-readable message.
struct RenderError {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    static RenderError invalid(std::string msg)
        { return { ErrorKind::InvalidParameters, std::move(msg) }; }
    static RenderError computation(std::string msg)
        { return { ErrorKind::ComputationFailure, std::move(msg) }; }
    static RenderError export_failure(std::string msg)
        { return { ErrorKind::ExportFailure, std::move(msg) }; }

    bool failed() const { return kind != ErrorKind::None; }
    explicit operator bool() const { return failed(); }
};

inline const char* error_kind_name(ErrorKind k)
{
    switch (k) {
        case ErrorKind::None:               return "ok";
        case ErrorKind::InvalidParameters:  return "invalid parameters";
        case ErrorKind::ComputationFailure: return "computation failure";
        case ErrorKind::ExportFailure:      return "export failure";
    }
    return "unknown";
}
