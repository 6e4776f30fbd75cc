#pragma once

#include "config.hpp"
#include "metadata.hpp"
#include "update_gate.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Data behind the host's "view details" dialog.
using PluginInformation = ResolvedMetadata;

// One plugin checked against one repository. The host calls these in place of
// its lifecycle hooks.
class Updater {
public:
    Updater(Identity identity, Config config, ResolverServices services, std::filesystem::path temp_root = {});

    const Identity& identity() const { return identity_; }
    const Config& config() const { return config_; }

    std::optional<ResolvedMetadata> resolve_metadata();

    std::optional<UpdateDecision> check_for_update(std::string_view installed_version, std::string_view host_version);

    // nullopt when requested_slug is not ours or nothing resolved.
    std::optional<PluginInformation> plugin_information(std::string_view requested_slug);

    // Purges the cached release and metadata when the applied update is ours.
    // Returns true when the cache was purged.
    bool on_update_applied(std::string_view applied_plugin);
    bool on_update_applied(const std::vector<std::string>& applied_plugins);

private:
    Identity identity_;
    Config config_;
    ResolverServices services_;
    MetadataResolver resolver_;
};

// Owns one Updater per plugin file reference.
class UpdaterRegistry {
public:
    explicit UpdaterRegistry(ResolverServices services, std::filesystem::path temp_root = {});

    // Existing updater for identity.plugin, or a new one built with config.
    // The config of an existing updater is kept.
    Updater& get_or_create(const Identity& identity, const Config& config);

    Updater* find(std::string_view plugin);

    // Notifies every registered updater. Returns how many purged their cache.
    size_t on_update_applied(const std::vector<std::string>& applied_plugins);

    void clear();
    size_t size() const { return updaters_.size(); }

private:
    ResolverServices services_;
    std::filesystem::path temp_root_;
    std::map<std::string, std::unique_ptr<Updater>, std::less<>> updaters_;
};
