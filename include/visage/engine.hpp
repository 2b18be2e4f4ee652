#pragma once

/** \file engine.hpp
 *  \brief Explicit lifecycle for the index, rebuild coordinator and service.
 *
 * Example usage:
 * ```cpp
 * visage::store::MemoryFaceStore store({.dimension = 512});
 * auto engine = visage::Engine::open(visage::load_config_from_env(), store);
 * if (!engine) return;
 * auto match = (*engine)->service().match_descriptor(descriptor);
 * (*engine)->shutdown();
 * ```
 *
 * The store is injected and must outlive the engine.
 */

#include <expected>
#include <memory>

#include "visage/config.hpp"
#include "visage/index/identity_index.hpp"
#include "visage/index/rebuild_coordinator.hpp"
#include "visage/service/identity_service.hpp"
#include "visage/store/face_record_store.hpp"

namespace visage {

class Engine {
public:
    /** \brief Validate config, start the coordinator and run the first rebuild.
     *
     * Errors: config_invalid if the config fails validate() or the store's
     * verified descriptors do not have index.dimension components.
     * A failed first rebuild is logged; the engine still opens with an empty
     * snapshot and retry_pending set.
     */
    static auto open(EngineConfig config, store::FaceRecordStore& store)
        -> std::expected<std::unique_ptr<Engine>, core::error>;

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    auto service() noexcept -> service::IdentityService& { return *service_; }
    auto index() noexcept -> index::IdentityIndex& { return *index_; }
    auto coordinator() noexcept -> index::RebuildCoordinator& { return *coordinator_; }
    [[nodiscard]] auto config() const noexcept -> const EngineConfig& { return config_; }

    /** \brief Stop background work. Queries keep serving the last snapshot. Idempotent. */
    auto shutdown() -> void;

private:
    Engine(EngineConfig config, store::FaceRecordStore& store);

    EngineConfig config_;
    store::FaceRecordStore& store_;
    std::unique_ptr<index::IdentityIndex> index_;
    std::unique_ptr<index::RebuildCoordinator> coordinator_;
    std::unique_ptr<service::IdentityService> service_;
};

} // namespace visage
