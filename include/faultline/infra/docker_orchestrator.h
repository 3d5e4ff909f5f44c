#pragma once

#include <faultline/infra/orchestrator.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <boost/beast/http/verb.hpp>
#include <nlohmann/json_fwd.hpp>

namespace faultline::infra {

struct DockerReply {
    unsigned status = 0;
    std::string body;
};

/**
 * @brief Docker Engine API client over the daemon's unix socket.
 *
 * Each call opens a fresh connection on a private io_context, so the object
 * can be shared by worker threads without locking.
 */
class DockerOrchestrator final : public IOrchestrator {
public:
    DockerOrchestrator(std::filesystem::path socketPath, std::chrono::milliseconds requestTimeout,
                       int stopTimeoutSeconds);

    Result<void> ping() override;
    Result<NodeStatus> inspectNode(const NodeId& node) override;
    Result<void> stopNode(const NodeId& node) override;
    Result<void> startNode(const NodeId& node) override;
    Result<NetworkInfo> inspectNetwork(const std::string& nameOrId) override;
    Result<void> disconnectNode(const NetworkInfo& network, const NodeId& node) override;
    Result<void> connectNode(const NetworkInfo& network, const NodeId& node) override;

    // Parses the body of GET /containers/{id}/json
    static Result<NodeStatus> parseContainer(const NodeId& node, const nlohmann::json& doc);

private:
    Result<DockerReply> request(boost::beast::http::verb verb, const std::string& target,
                                const std::optional<std::string>& body = std::nullopt,
                                std::chrono::milliseconds extra = std::chrono::milliseconds{0});

    std::filesystem::path socketPath_;
    std::chrono::milliseconds requestTimeout_;
    int stopTimeoutSeconds_;
};

// Parses Docker's RFC 3339 timestamps ("2024-05-01T10:20:30.123456789Z").
std::optional<TimePoint> parseDockerTime(const std::string& text);

} // namespace faultline::infra
