#pragma once

#include "config.hpp"
#include "metadata.hpp"

#include <optional>
#include <string>
#include <string_view>

// Host-facing update record. Only built when an update is available.
struct UpdateDecision {
    bool available = true;
    std::string id;  // "github.com/{owner}/{repo}"
    std::string slug;
    std::string plugin;
    std::string new_version;
    std::string package_url;
    std::string tested_up_to;
    std::string host_url;
    std::string minimum_host_version;
    std::string minimum_runtime_version;
};

// nullopt when metadata.version is not newer than installed_version, or when the
// host is older than metadata.minimum_host_version.
std::optional<UpdateDecision> decide_update(const Identity& identity, const ResolvedMetadata& metadata,
                                            std::string_view installed_version, std::string_view host_version);

nlohmann::json to_json(const UpdateDecision& decision);
