#include "sandbox/requests.hpp"

#include <algorithm>
#include <cctype>

#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"

namespace ilbox::sandbox {
namespace {

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void RequirePath(const std::string& path) {
    if (utils::Trim(path).empty()) {
        throw SandboxError(ErrorCode::kInvalidRequest, "path is required");
    }
}

}  // namespace

bool IsValidUserId(const std::string& user_id) {
    if (user_id.empty() || user_id.size() > 64) {
        return false;
    }
    return std::all_of(user_id.begin(), user_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

bool IsValidPackageSpec(const std::string& spec) {
    if (spec.empty() || spec.size() > kMaxPackageLength) {
        return false;
    }
    if (!std::isalnum(static_cast<unsigned char>(spec.front()))) {
        return false;
    }
    static const std::string kAllowed = "._-[],=<>!~";
    return std::all_of(spec.begin(), spec.end(), [](unsigned char c) {
        return std::isalnum(c) || kAllowed.find(static_cast<char>(c)) != std::string::npos;
    });
}

void RequireValidUserId(const std::string& user_id) {
    if (!IsValidUserId(user_id)) {
        throw SandboxError(ErrorCode::kInvalidRequest, "invalid user id: '" + user_id + "'");
    }
}

std::string ExtractCodeBlock(const std::string& raw) {
    const auto content = utils::Trim(raw);
    if (content.size() >= 6 && StartsWith(content, "```") && EndsWith(content, "```")) {
        auto inner = content.substr(3, content.size() - 6);
        if (StartsWith(inner, "python\n") || StartsWith(inner, "py\n")) {
            inner = inner.substr(inner.find('\n') + 1);
        }
        return utils::Trim(inner);
    }
    if (content.size() >= 2 && content.front() == '`' && content.back() == '`') {
        return utils::Trim(content.substr(1, content.size() - 2));
    }
    return content;
}

RunRequest MakeRunRequest(const std::string& user_id, const std::string& raw_code, const std::string& workdir) {
    RequireValidUserId(user_id);
    RunRequest request{};
    request.user_id = user_id;
    request.code = ExtractCodeBlock(raw_code);
    if (request.code.empty()) {
        throw SandboxError(ErrorCode::kInvalidRequest, "code is required");
    }
    if (request.code.size() > kMaxCodeBytes) {
        throw SandboxError(ErrorCode::kInvalidRequest, "code exceeds " + std::to_string(kMaxCodeBytes) + " bytes");
    }
    request.workdir = utils::Trim(workdir);
    return request;
}

InstallRequest MakeInstallRequest(const std::string& user_id, const std::string& raw_packages) {
    return MakeInstallRequest(user_id, utils::SplitWhitespace(raw_packages));
}

InstallRequest MakeInstallRequest(const std::string& user_id, const std::vector<std::string>& packages) {
    RequireValidUserId(user_id);
    InstallRequest request{};
    request.user_id = user_id;
    for (const auto& raw : packages) {
        const auto spec = utils::Trim(raw);
        if (spec.empty()) {
            continue;
        }
        if (!IsValidPackageSpec(spec)) {
            throw SandboxError(ErrorCode::kInvalidRequest, "invalid package name: '" + spec + "'");
        }
        request.packages.push_back(spec);
    }
    if (request.packages.empty()) {
        throw SandboxError(ErrorCode::kInvalidRequest, "provide at least one package name");
    }
    if (request.packages.size() > kMaxPackages) {
        throw SandboxError(ErrorCode::kInvalidRequest,
                           "at most " + std::to_string(kMaxPackages) + " packages per install");
    }
    return request;
}

ListRequest MakeListRequest(const std::string& user_id, const std::string& path, long long page) {
    RequireValidUserId(user_id);
    if (page < 0) {
        throw SandboxError(ErrorCode::kInvalidRequest, "page must not be negative");
    }
    ListRequest request{};
    request.user_id = user_id;
    request.path = utils::Trim(path);
    request.page = static_cast<std::size_t>(page);
    return request;
}

WriteRequest MakeWriteRequest(const std::string& user_id, const std::string& path, const std::string& content) {
    RequireValidUserId(user_id);
    RequirePath(path);
    if (content.size() > kMaxWriteBytes) {
        throw SandboxError(ErrorCode::kInvalidRequest, "content exceeds " + std::to_string(kMaxWriteBytes) + " bytes");
    }
    WriteRequest request{};
    request.user_id = user_id;
    request.path = utils::Trim(path);
    request.content = content;
    return request;
}

RemoveRequest MakeRemoveRequest(const std::string& user_id, const std::string& path, bool recursive) {
    RequireValidUserId(user_id);
    RequirePath(path);
    RemoveRequest request{};
    request.user_id = user_id;
    request.path = utils::Trim(path);
    request.recursive = recursive;
    return request;
}

}  // namespace ilbox::sandbox
