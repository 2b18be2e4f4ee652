#pragma once

/** \file config.hpp
 *  \brief Engine configuration: typed parameter structs, env overrides, validation.
 *
 * Environment variables (unparsable values are ignored with a warning):
 *   VISAGE_MATCH_THRESHOLD    float in [-1, 1]
 *   VISAGE_CLUSTER_THRESHOLD  float in [-1, 1]
 *   VISAGE_INDEX_MODE         flat | ivf | auto
 *   VISAGE_IVF_NLIST          unsigned
 *   VISAGE_IVF_NPROBE         unsigned
 *   VISAGE_SYNC_REBUILD       1/0, true/false
 *   VISAGE_DELETE_CASCADE     detach | remove_faces
 *   VISAGE_LOG_LEVEL          trace|debug|info|warn|error|critical|off
 */

#include <expected>
#include <optional>
#include <string_view>

#include "visage/cluster/clustering.hpp"
#include "visage/core/logging.hpp"
#include "visage/error.hpp"
#include "visage/index/identity_index.hpp"
#include "visage/index/rebuild_coordinator.hpp"
#include "visage/service/identity_service.hpp"

namespace visage {

struct EngineConfig {
    index::IndexBuildParams index;
    index::RebuildParams rebuild;
    cluster::ClusterParams cluster;
    service::ServiceParams service;
    core::LogParams log;
    bool configure_logging{true};   /**< Engine::open calls core::init_logging(log) */
};

/** \brief Defaults with environment overrides applied. */
auto load_config_from_env() -> EngineConfig;

/** \brief Apply VISAGE_* overrides in place. */
auto apply_env_overrides(EngineConfig& config) -> void;

/** \brief config_invalid describing the first out-of-range value. */
auto validate(const EngineConfig& config) -> std::expected<void, core::error>;

auto parse_delete_cascade(std::string_view s) noexcept -> std::optional<store::DeleteCascade>;

} // namespace visage
