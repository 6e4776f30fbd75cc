#include "updater.hpp"
#include "cache.hpp"
#include "sanitizer.hpp"
#include "utils.hpp"

#include <algorithm>
#include <utility>

Updater::Updater(Identity identity, Config config, ResolverServices services, std::filesystem::path temp_root)
    : identity_(std::move(identity)),
      config_(std::move(config)),
      services_(services),
      resolver_(services, std::move(temp_root)) {}

std::optional<ResolvedMetadata> Updater::resolve_metadata() {
    return resolver_.resolve_metadata(identity_, config_);
}

std::optional<UpdateDecision> Updater::check_for_update(std::string_view installed_version, std::string_view host_version) {
    auto metadata = resolve_metadata();
    if (!metadata) {
        return std::nullopt;
    }
    return decide_update(identity_, *metadata, installed_version, host_version);
}

std::optional<PluginInformation> Updater::plugin_information(std::string_view requested_slug) {
    if (requested_slug != identity_.slug) {
        return std::nullopt;
    }

    auto metadata = resolve_metadata();
    if (!metadata) {
        return std::nullopt;
    }

    PluginInformation info = std::move(*metadata);
    // The release comes from the cache written during resolution.
    if (auto release = resolver_.latest_release(identity_, config_)) {
        if (!trim(release->body).empty()) {
            info.sections["other_notes"] = services_.sanitizer.sanitize(release->body);
        }
    }
    return info;
}

bool Updater::on_update_applied(std::string_view applied_plugin) {
    if (applied_plugin != identity_.plugin) {
        return false;
    }
    purge_cache(services_.cache, identity_.slug);
    log_info("Cleared cached update data", {{"plugin", identity_.plugin}, {"slug", identity_.slug}});
    return true;
}

bool Updater::on_update_applied(const std::vector<std::string>& applied_plugins) {
    if (std::ranges::find(applied_plugins, identity_.plugin) == applied_plugins.end()) {
        return false;
    }
    return on_update_applied(identity_.plugin);
}

UpdaterRegistry::UpdaterRegistry(ResolverServices services, std::filesystem::path temp_root)
    : services_(services), temp_root_(std::move(temp_root)) {}

Updater& UpdaterRegistry::get_or_create(const Identity& identity, const Config& config) {
    auto it = updaters_.find(identity.plugin);
    if (it != updaters_.end()) {
        return *it->second;
    }
    auto updater = std::make_unique<Updater>(identity, config, services_, temp_root_);
    auto& ref = *updater;
    updaters_.emplace(identity.plugin, std::move(updater));
    log_debug("Registered updater", {{"plugin", identity.plugin}, {"repository", identity.repository}});
    return ref;
}

Updater* UpdaterRegistry::find(std::string_view plugin) {
    auto it = updaters_.find(plugin);
    return it == updaters_.end() ? nullptr : it->second.get();
}

size_t UpdaterRegistry::on_update_applied(const std::vector<std::string>& applied_plugins) {
    size_t purged = 0;
    for (auto& [plugin, updater] : updaters_) {
        if (updater->on_update_applied(applied_plugins)) ++purged;
    }
    return purged;
}

void UpdaterRegistry::clear() {
    updaters_.clear();
}
