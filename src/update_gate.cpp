#include "update_gate.hpp"
#include "utils.hpp"
#include "version.hpp"

std::optional<UpdateDecision> decide_update(const Identity& identity, const ResolvedMetadata& metadata,
                                            std::string_view installed_version, std::string_view host_version) {
    if (metadata.version.empty()) {
        log_warning("Resolved metadata has no version", {{"slug", identity.slug}});
        return std::nullopt;
    }

    if (!version_compare(installed_version, metadata.version)) {
        log_debug("Installed version is current", {{"installed", std::string(installed_version)}, {"latest", metadata.version}});
        return std::nullopt;
    }

    if (!metadata.minimum_host_version.empty() && !host_version.empty()
        && version_compare(host_version, metadata.minimum_host_version)) {
        log_info("Update withheld: host version below requirement", {
            {"slug", identity.slug},
            {"host_version", std::string(host_version)},
            {"requires", metadata.minimum_host_version},
        });
        return std::nullopt;
    }

    UpdateDecision decision;
    decision.id = "github.com/" + identity.repository;
    decision.slug = identity.slug;
    decision.plugin = identity.plugin;
    decision.new_version = metadata.version;
    decision.package_url = metadata.download_url;
    decision.tested_up_to = metadata.tested_up_to;
    decision.host_url = metadata.author_profile_url;
    decision.minimum_host_version = metadata.minimum_host_version;
    decision.minimum_runtime_version = metadata.minimum_runtime_version;
    return decision;
}

nlohmann::json to_json(const UpdateDecision& d) {
    return {
        {"id", d.id},
        {"slug", d.slug},
        {"plugin", d.plugin},
        {"new_version", d.new_version},
        {"package", d.package_url},
        {"tested", d.tested_up_to},
        {"url", d.host_url},
        {"requires", d.minimum_host_version},
        {"requires_php", d.minimum_runtime_version},
    };
}
