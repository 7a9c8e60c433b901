#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_error.hpp"
#include "sandbox/sandbox_service.hpp"

namespace ilbox::gateway {

int HttpStatusFor(sandbox::ErrorCode code);

nlohmann::json ErrorJson(const sandbox::SandboxError& error);
nlohmann::json SandboxJson(const sandbox::Sandbox& sandbox);
nlohmann::json RunJson(const sandbox::RunOutcome& outcome);
nlohmann::json DirectoryJson(const sandbox::DirectoryPage& page);
nlohmann::json HealthJson(const sandbox::HealthStatus& status);
nlohmann::json LogUpdateJson(const sandbox::LogUpdate& update, const sandbox::OutputFormatter& formatter);

// JSON front-end over SandboxService. Install logs are streamed back as one
// JSON object per line.
class HttpGateway {
public:
    HttpGateway(sandbox::SandboxService& service, config::GatewayConfig config);

    // Blocks until Stop() is called. Returns false if the socket could not be bound.
    bool Listen();
    void Stop();

    const config::GatewayConfig& Config() const { return config_; }

private:
    void RegisterRoutes();

    sandbox::SandboxService& service_;
    config::GatewayConfig config_;
    httplib::Server server_;
};

}  // namespace ilbox::gateway
