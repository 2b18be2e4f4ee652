#include "visage/config.hpp"
#include "visage/core/platform_utils.hpp"

#include <cmath>
#include <string>

namespace visage {

namespace {

template <typename T, typename Parse>
void override_from_env(const char* name, T& target, Parse parse) {
    auto raw = core::getenv_nonempty(name);
    if (!raw) return;
    if (auto v = parse(*raw)) {
        target = *v;
    } else {
        core::logger().warn("[config] ignoring unparsable {}={}", name, *raw);
    }
}

inline bool in_unit_range(float t) {
    return std::isfinite(t) && t >= -1.0f && t <= 1.0f;
}

auto invalid(std::string message) -> std::unexpected<core::error> {
    return core::make_error(core::error_code::config_invalid, std::move(message), "config");
}

} // anonymous namespace

auto parse_delete_cascade(std::string_view s) noexcept -> std::optional<store::DeleteCascade> {
    if (s == "detach") return store::DeleteCascade::detach;
    if (s == "remove_faces") return store::DeleteCascade::remove_faces;
    return std::nullopt;
}

auto apply_env_overrides(EngineConfig& config) -> void {
    override_from_env("VISAGE_MATCH_THRESHOLD", config.service.match_threshold, core::parse_float);
    override_from_env("VISAGE_CLUSTER_THRESHOLD", config.cluster.threshold, core::parse_float);
    override_from_env("VISAGE_INDEX_MODE", config.index.mode,
                      [](const std::string& s) { return index::parse_index_mode(s); });
    override_from_env("VISAGE_IVF_NLIST", config.index.nlist, core::parse_u32);
    override_from_env("VISAGE_IVF_NPROBE", config.index.nprobe, core::parse_u32);
    override_from_env("VISAGE_SYNC_REBUILD", config.service.synchronous_rebuild, core::parse_bool_ci);
    override_from_env("VISAGE_DELETE_CASCADE", config.service.delete_cascade,
                      [](const std::string& s) { return parse_delete_cascade(s); });
    if (auto level = core::getenv_nonempty("VISAGE_LOG_LEVEL")) {
        config.log.level = *level;
    }
}

auto load_config_from_env() -> EngineConfig {
    EngineConfig config;
    apply_env_overrides(config);
    return config;
}

auto validate(const EngineConfig& config) -> std::expected<void, core::error> {
    if (config.index.dimension == 0) return invalid("index.dimension must be > 0");
    if (!in_unit_range(config.service.match_threshold)) {
        return invalid("service.match_threshold must lie in [-1, 1]");
    }
    if (!in_unit_range(config.cluster.threshold)) {
        return invalid("cluster.threshold must lie in [-1, 1]");
    }
    if (config.index.mode != index::IndexMode::flat) {
        if (config.index.nlist == 0) return invalid("index.nlist must be > 0");
        if (config.index.nprobe == 0 || config.index.nprobe > config.index.nlist) {
            return invalid("index.nprobe must lie in [1, nlist]");
        }
    }
    if (!std::isfinite(config.index.recall_margin) || config.index.recall_margin < 0.0f) {
        return invalid("index.recall_margin must be >= 0");
    }
    if (config.rebuild.escalate_after == 0) return invalid("rebuild.escalate_after must be > 0");
    if (config.rebuild.retry_backoff.count() < 0) return invalid("rebuild.retry_backoff must be >= 0");
    if (config.service.sync_timeout.count() <= 0) return invalid("service.sync_timeout must be > 0");
    if (spdlog::level::from_str(config.log.level) == spdlog::level::off && config.log.level != "off") {
        return invalid("log.level is not a known level: " + config.log.level);
    }
    return {};
}

} // namespace visage
