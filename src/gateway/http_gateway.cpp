#include "gateway/http_gateway.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "sandbox/requests.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ilbox::gateway {
namespace {

constexpr const char* kJsonType = "application/json";
constexpr const char* kStreamType = "application/x-ndjson";

using sandbox::ErrorCode;
using sandbox::SandboxError;

template <typename Handler>
void Respond(httplib::Response& res, Handler&& handler) {
    try {
        handler();
    } catch (const SandboxError& ex) {
        res.status = HttpStatusFor(ex.Code());
        res.set_content(ErrorJson(ex).dump(), kJsonType);
    } catch (const nlohmann::json::exception& ex) {
        res.status = 400;
        res.set_content(ErrorJson(SandboxError(ErrorCode::kInvalidRequest, ex.what())).dump(), kJsonType);
    } catch (const std::exception& ex) {
        utils::LogError("gateway", std::string("unhandled error: ") + ex.what());
        res.status = 500;
        res.set_content(nlohmann::json{{"error", "internal_error"}, {"message", ex.what()}}.dump(), kJsonType);
    }
}

nlohmann::json ParseBody(const httplib::Request& req) {
    if (utils::Trim(req.body).empty()) {
        return nlohmann::json::object();
    }
    auto json = nlohmann::json::parse(req.body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw SandboxError(ErrorCode::kInvalidRequest, "request body must be a JSON object");
    }
    return json;
}

long long ParsePage(const httplib::Request& req) {
    if (!req.has_param("page")) {
        return 0;
    }
    const auto value = req.get_param_value("page");
    try {
        std::size_t consumed = 0;
        const auto page = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return page;
    } catch (const std::logic_error&) {
        throw SandboxError(ErrorCode::kInvalidRequest, "page must be an integer: '" + value + "'");
    }
}

bool ParseFlag(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) {
        return false;
    }
    const auto value = utils::ToLower(req.get_param_value(name));
    return value == "1" || value == "true" || value == "yes";
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& json) {
    res.status = status;
    res.set_content(json.dump(), kJsonType);
}

}  // namespace

int HttpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNotFound:
        case ErrorCode::kPathNotFound:
            return 404;
        case ErrorCode::kAlreadyExists:
        case ErrorCode::kNotEmpty:
            return 409;
        case ErrorCode::kPathEscape:
            return 403;
        case ErrorCode::kSandboxBusy:
            return 423;
        case ErrorCode::kInvalidRequest:
            return 400;
        case ErrorCode::kInfrastructure:
            return 503;
        case ErrorCode::kStorage:
            return 500;
    }
    return 500;
}

nlohmann::json ErrorJson(const SandboxError& error) {
    return {{"error", sandbox::ToString(error.Code())}, {"message", error.what()}};
}

nlohmann::json SandboxJson(const sandbox::Sandbox& sandbox) {
    nlohmann::json json = {
        {"user_id", sandbox.user_id},
        {"root", sandbox.root.string()},
        {"created_at_ms", utils::ToMs(sandbox.created_at)},
        {"last_used_ms", utils::ToMs(sandbox.last_used_at)}
    };
    json["size_bytes"] = sandbox.size_bytes.has_value() ? nlohmann::json(*sandbox.size_bytes)
                                                        : nlohmann::json(nullptr);
    return json;
}

nlohmann::json RunJson(const sandbox::RunOutcome& outcome) {
    const auto& result = outcome.result;
    const auto& formatted = outcome.formatted;
    nlohmann::json json = {
        {"exit_code", result.exit_code},
        {"timed_out", result.timed_out},
        {"resource_exceeded", result.resource_exceeded},
        {"truncated", result.truncated},
        {"stdout", result.output},
        {"stderr", result.error},
        {"elapsed_ms", result.elapsed.count()}
    };
    nlohmann::json display = {
        {"inline", formatted.is_inline},
        {"text", formatted.text}
    };
    display["note"] = formatted.note.empty() ? nlohmann::json(nullptr) : nlohmann::json(formatted.note);
    if (!formatted.is_inline) {
        display["attachment_name"] = formatted.attachment_name;
        display["attachment"] = formatted.attachment;
    }
    json["display"] = std::move(display);
    return json;
}

nlohmann::json DirectoryJson(const sandbox::DirectoryPage& page) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : page.entries) {
        entries.push_back({
            {"name", entry.name},
            {"type", entry.is_directory ? "dir" : "file"},
            {"size_bytes", entry.is_directory ? nlohmann::json(nullptr) : nlohmann::json(entry.size_bytes)}
        });
    }
    return {
        {"cwd", page.cwd},
        {"page", page.page},
        {"total_pages", page.total_pages},
        {"total_entries", page.total_entries},
        {"entries", std::move(entries)}
    };
}

nlohmann::json HealthJson(const sandbox::HealthStatus& status) {
    return {
        {"runtime_reachable", status.runtime_reachable},
        {"image_present", status.image_present},
        {"message", status.message}
    };
}

nlohmann::json LogUpdateJson(const sandbox::LogUpdate& update, const sandbox::OutputFormatter& formatter) {
    return {
        {"log", formatter.LogTail(update.snapshot)},
        {"final", update.final},
        {"success", update.success}
    };
}

HttpGateway::HttpGateway(sandbox::SandboxService& service, config::GatewayConfig config)
    : service_(service)
    , config_(std::move(config)) {
    RegisterRoutes();
}

bool HttpGateway::Listen() {
    utils::LogInfo("gateway", "listening on " + config_.host + ":" + std::to_string(config_.port));
    const bool ok = server_.listen(config_.host, config_.port);
    if (!ok) {
        utils::LogError("gateway", "failed to listen on " + config_.host + ":" + std::to_string(config_.port));
    }
    return ok;
}

void HttpGateway::Stop() {
    server_.stop();
}

void HttpGateway::RegisterRoutes() {
    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        Respond(res, [&]() {
            const auto status = service_.HealthCheck();
            const bool healthy = status.runtime_reachable && status.image_present;
            SendJson(res, healthy ? 200 : 503, HealthJson(status));
        });
    });

    server_.Post(R"(/sandboxes/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            SendJson(res, 201, SandboxJson(service_.Create(req.matches[1])));
        });
    });

    server_.Get(R"(/sandboxes/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            SendJson(res, 200, SandboxJson(service_.Info(req.matches[1])));
        });
    });

    server_.Delete(R"(/sandboxes/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            const std::string user_id = req.matches[1];
            service_.DeleteSandbox(user_id);
            SendJson(res, 200, {{"deleted", user_id}});
        });
    });

    server_.Post(R"(/sandboxes/([^/]+)/run)", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            const auto body = ParseBody(req);
            const auto request = sandbox::MakeRunRequest(
                req.matches[1],
                body.value("code", std::string()),
                body.value("workdir", std::string()));
            SendJson(res, 200, RunJson(service_.Run(request)));
        });
    });

    server_.Get(R"(/sandboxes/([^/]+)/files)", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            const auto request = sandbox::MakeListRequest(
                req.matches[1], req.get_param_value("path"), ParsePage(req));
            SendJson(res, 200, DirectoryJson(service_.ListDirectory(request)));
        });
    });

    server_.Put(R"(/sandboxes/([^/]+)/files)", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            const auto request = sandbox::MakeWriteRequest(
                req.matches[1], req.get_param_value("path"), req.body);
            const auto bytes = service_.WriteFile(request);
            SendJson(res, 200, {{"path", request.path}, {"bytes", bytes}});
        });
    });

    server_.Delete(R"(/sandboxes/([^/]+)/files)", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            const auto request = sandbox::MakeRemoveRequest(
                req.matches[1], req.get_param_value("path"), ParseFlag(req, "recursive"));
            service_.RemoveEntry(request);
            SendJson(res, 200, {{"removed", request.path}});
        });
    });

    server_.Post(R"(/sandboxes/([^/]+)/install)", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(res, [&]() {
            const auto body = ParseBody(req);
            const auto packages = body.contains("packages") ? body.at("packages") : nlohmann::json();
            sandbox::InstallRequest request;
            if (packages.is_array()) {
                request = sandbox::MakeInstallRequest(req.matches[1], packages.get<std::vector<std::string>>());
            } else if (packages.is_string()) {
                request = sandbox::MakeInstallRequest(req.matches[1], packages.get<std::string>());
            } else {
                throw SandboxError(ErrorCode::kInvalidRequest, "packages must be a list or a space separated string");
            }

            // Busy and missing sandboxes are answered with their own status;
            // only failures during the install itself arrive in the stream.
            std::shared_ptr<sandbox::PendingInstall> pending = service_.PrepareInstall(request);
            auto& service = service_;
            res.set_chunked_content_provider(
                kStreamType,
                [&service, pending](std::size_t, httplib::DataSink& sink) mutable {
                    if (!pending) {
                        return false;
                    }
                    const auto write_line = [&sink](const nlohmann::json& line) {
                        const auto text = line.dump() + "\n";
                        sink.write(text.data(), text.size());
                    };
                    try {
                        const auto result = service.FinishInstall(
                            *pending,
                            [&](const sandbox::LogUpdate& update) {
                                write_line(LogUpdateJson(update, service.Formatter()));
                            });
                        write_line({
                            {"done", true},
                            {"success", result.success},
                            {"exit_code", result.exit_code},
                            {"timed_out", result.timed_out}
                        });
                    } catch (const SandboxError& ex) {
                        auto error = ErrorJson(ex);
                        error["done"] = true;
                        error["status"] = HttpStatusFor(ex.Code());
                        write_line(error);
                    }
                    pending.reset();
                    sink.done();
                    return true;
                });
        });
    });
}

}  // namespace ilbox::gateway
