#pragma once

#include <stdexcept>
#include <string>

namespace ilbox::sandbox {

enum class ErrorCode {
    kNotFound,
    kAlreadyExists,
    kPathEscape,
    kPathNotFound,
    kNotEmpty,
    kSandboxBusy,
    kInvalidRequest,
    kInfrastructure,
    kStorage
};

inline const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kAlreadyExists: return "already_exists";
        case ErrorCode::kPathEscape: return "path_escape";
        case ErrorCode::kPathNotFound: return "path_not_found";
        case ErrorCode::kNotEmpty: return "not_empty";
        case ErrorCode::kSandboxBusy: return "sandbox_busy";
        case ErrorCode::kInvalidRequest: return "invalid_request";
        case ErrorCode::kInfrastructure: return "infrastructure_error";
        case ErrorCode::kStorage: return "storage_error";
    }
    return "unknown";
}

class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace ilbox::sandbox
