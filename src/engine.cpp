#include "visage/engine.hpp"
#include "visage/core/logging.hpp"

#include <string>

namespace visage {

namespace {

/** First stored verified descriptor must have the configured dimension.
 *  Scan errors are left to the initial rebuild to report. */
auto check_store_dimension(const store::FaceRecordStore& store, std::size_t dimension)
    -> std::expected<void, core::error> {
    auto cursor = store.verified_descriptors();
    if (!cursor) return {};
    auto first = (*cursor)->next();
    if (!first || !*first) return {};
    const std::size_t stored = (*first)->descriptor.size();
    if (stored != dimension) {
        return core::make_error(core::error_code::config_invalid,
                                "index.dimension is " + std::to_string(dimension) +
                                " but stored descriptors have dimension " + std::to_string(stored),
                                "engine");
    }
    return {};
}

} // anonymous namespace

Engine::Engine(EngineConfig config, store::FaceRecordStore& store)
    : config_(std::move(config))
    , store_(store)
    , index_(std::make_unique<index::IdentityIndex>(config_.index))
    , coordinator_(std::make_unique<index::RebuildCoordinator>(store_, *index_, config_.rebuild))
    , service_(std::make_unique<service::IdentityService>(store_, *index_, *coordinator_,
                                                          config_.service, config_.cluster)) {}

Engine::~Engine() {
    shutdown();
}

auto Engine::open(EngineConfig config, store::FaceRecordStore& store)
    -> std::expected<std::unique_ptr<Engine>, core::error> {
    if (auto r = validate(config); !r) return std::unexpected(r.error());
    if (config.configure_logging) core::init_logging(config.log);
    if (auto r = check_store_dimension(store, config.index.dimension); !r) {
        core::logger().error("[engine] {}", r.error().message);
        return std::unexpected(r.error());
    }

    std::unique_ptr<Engine> engine(new Engine(std::move(config), store));
    const auto& cfg = engine->config_;
    core::logger().info("[engine] dimension {}, mode {}, tau_match {:.3f}, tau_cluster {:.3f}",
                        cfg.index.dimension, index::to_string(cfg.index.mode),
                        cfg.service.match_threshold, cfg.cluster.threshold);

    const auto ticket = engine->coordinator_->request_rebuild();
    if (auto r = engine->coordinator_->wait(ticket); !r) {
        core::logger().error("[engine] initial rebuild failed ({}): {}; serving an empty index",
                             core::to_string(r.error().code), r.error().message);
    } else {
        core::logger().info("[engine] initial index holds {} faces of {} people",
                            engine->index_->snapshot()->size(),
                            engine->index_->snapshot()->person_count());
    }
    return engine;
}

auto Engine::shutdown() -> void {
    if (coordinator_) coordinator_->stop();
}

} // namespace visage
