/**
 * @file docker_schema.hpp
 * @brief Engine API request and response documents
 *
 * Only the fields this tool sends or reads are modelled.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace noritest {
namespace docker {
namespace docker_schema {

struct HostConfig {
    std::vector<std::string> Binds;   ///< "host:container:mode"
    bool Privileged{false};
    bool AutoRemove{false};
};

struct CreateContainer {
    std::string Image;
    std::vector<std::string> Cmd;
    std::vector<std::string> Env;     ///< "KEY=VALUE"
    std::string User;
    std::string WorkingDir;
    bool Tty{false};
    bool AttachStdin{false};
    bool AttachStdout{true};
    bool AttachStderr{true};
    HostConfig Host;
};

struct CreatedContainer {
    std::string Id;
    std::vector<std::string> Warnings;
};

struct ContainerSummary {
    std::string Id;
    std::vector<std::string> Names;
    std::string Image;
    std::string State;
};

inline void to_json(nlohmann::json& j, const HostConfig& config) {
    j = nlohmann::json{
        {"Binds", config.Binds},
        {"Privileged", config.Privileged},
        {"AutoRemove", config.AutoRemove}
    };
}

inline void to_json(nlohmann::json& j, const CreateContainer& request) {
    j = nlohmann::json{
        {"Image", request.Image},
        {"Cmd", request.Cmd},
        {"User", request.User},
        {"WorkingDir", request.WorkingDir},
        {"Tty", request.Tty},
        {"OpenStdin", false},
        {"AttachStdin", request.AttachStdin},
        {"AttachStdout", request.AttachStdout},
        {"AttachStderr", request.AttachStderr},
        {"HostConfig", request.Host}
    };
    if (!request.Env.empty()) {
        j["Env"] = request.Env;
    }
}

inline void from_json(const nlohmann::json& j, CreatedContainer& created) {
    j.at("Id").get_to(created.Id);
    created.Warnings.clear();
    if (j.contains("Warnings") && j["Warnings"].is_array()) {
        j["Warnings"].get_to(created.Warnings);
    }
}

inline void from_json(const nlohmann::json& j, ContainerSummary& summary) {
    j.at("Id").get_to(summary.Id);
    summary.Names = j.value("Names", std::vector<std::string>{});
    summary.Image = j.value("Image", std::string{});
    summary.State = j.value("State", std::string{});
}

} // namespace docker_schema
} // namespace docker
} // namespace noritest
