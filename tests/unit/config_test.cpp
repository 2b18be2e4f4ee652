#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>

#include "visage/config.hpp"
#include "visage/core/platform_utils.hpp"

using namespace visage;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

namespace {

const char* const kAllVars[] = {
    "VISAGE_MATCH_THRESHOLD", "VISAGE_CLUSTER_THRESHOLD", "VISAGE_INDEX_MODE",
    "VISAGE_IVF_NLIST",       "VISAGE_IVF_NPROBE",        "VISAGE_SYNC_REBUILD",
    "VISAGE_DELETE_CASCADE",  "VISAGE_LOG_LEVEL",
};

/** Clears every VISAGE_* override on entry and exit. */
struct CleanEnv {
    CleanEnv() { clear(); }
    ~CleanEnv() { clear(); }
    static void clear() {
        for (const char* name : kAllVars) unset_env_var(name);
    }
};

} // anonymous namespace

TEST_CASE("safe_getenv distinguishes unset from empty", "[platform][env]") {
    const char* key = "VISAGE_TEST_SAFE_GETENV";
    unset_env_var(key);
    REQUIRE_FALSE(core::safe_getenv(key).has_value());
    REQUIRE_FALSE(core::safe_getenv(nullptr).has_value());

    set_env_var(key, "hello_world");
    auto v = core::safe_getenv(key);
    REQUIRE(v.has_value());
    REQUIRE(*v == std::string("hello_world"));

#if !defined(_WIN32)
    set_env_var(key, "");
    REQUIRE(core::safe_getenv(key).has_value());
    REQUIRE_FALSE(core::getenv_nonempty(key).has_value());
#endif
    unset_env_var(key);
}

TEST_CASE("value parsers reject partial input", "[platform][env]") {
    REQUIRE(core::parse_bool_ci("TRUE") == true);
    REQUIRE(core::parse_bool_ci("0") == false);
    REQUIRE_FALSE(core::parse_bool_ci("yes").has_value());
    REQUIRE(core::parse_float("0.75") == 0.75f);
    REQUIRE_FALSE(core::parse_float("0.75x").has_value());
    REQUIRE(core::parse_u32("128") == 128u);
    REQUIRE_FALSE(core::parse_u32("-1").has_value());
}

TEST_CASE("defaults are valid", "[config]") {
    CleanEnv env;
    const auto config = load_config_from_env();
    REQUIRE(validate(config).has_value());
    REQUIRE(config.service.match_threshold == 0.6f);
    REQUIRE(config.index.mode == index::IndexMode::flat);
    REQUIRE(config.service.delete_cascade == store::DeleteCascade::detach);
    REQUIRE_FALSE(config.service.synchronous_rebuild);
}

TEST_CASE("environment overrides apply", "[config]") {
    CleanEnv env;
    set_env_var("VISAGE_MATCH_THRESHOLD", "0.55");
    set_env_var("VISAGE_CLUSTER_THRESHOLD", "0.8");
    set_env_var("VISAGE_INDEX_MODE", "ivf");
    set_env_var("VISAGE_IVF_NLIST", "128");
    set_env_var("VISAGE_IVF_NPROBE", "12");
    set_env_var("VISAGE_SYNC_REBUILD", "true");
    set_env_var("VISAGE_DELETE_CASCADE", "remove_faces");
    set_env_var("VISAGE_LOG_LEVEL", "debug");

    const auto config = load_config_from_env();
    REQUIRE(config.service.match_threshold == 0.55f);
    REQUIRE(config.cluster.threshold == 0.8f);
    REQUIRE(config.index.mode == index::IndexMode::ivf);
    REQUIRE(config.index.nlist == 128);
    REQUIRE(config.index.nprobe == 12);
    REQUIRE(config.service.synchronous_rebuild);
    REQUIRE(config.service.delete_cascade == store::DeleteCascade::remove_faces);
    REQUIRE(config.log.level == "debug");
    REQUIRE(validate(config).has_value());
}

TEST_CASE("unparsable overrides keep the previous value", "[config]") {
    CleanEnv env;
    set_env_var("VISAGE_MATCH_THRESHOLD", "high");
    set_env_var("VISAGE_INDEX_MODE", "hnsw");
    set_env_var("VISAGE_DELETE_CASCADE", "purge");

    EngineConfig config;
    config.service.match_threshold = 0.42f;
    apply_env_overrides(config);
    REQUIRE(config.service.match_threshold == 0.42f);
    REQUIRE(config.index.mode == index::IndexMode::flat);
    REQUIRE(config.service.delete_cascade == store::DeleteCascade::detach);
}

TEST_CASE("validate rejects out-of-range values", "[config]") {
    EngineConfig config;

    SECTION("match threshold") {
        config.service.match_threshold = 1.01f;
    }
    SECTION("cluster threshold") {
        config.cluster.threshold = -2.0f;
    }
    SECTION("zero dimension") {
        config.index.dimension = 0;
    }
    SECTION("nprobe above nlist") {
        config.index.mode = index::IndexMode::ivf;
        config.index.nlist = 4;
        config.index.nprobe = 8;
    }
    SECTION("negative recall margin") {
        config.index.recall_margin = -0.1f;
    }
    SECTION("unknown log level") {
        config.log.level = "loud";
    }
    SECTION("zero sync timeout") {
        config.service.sync_timeout = std::chrono::milliseconds{0};
    }

    auto r = validate(config);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::config_invalid);
    REQUIRE(r.error().component == "config");
}

TEST_CASE("delete cascade names", "[config]") {
    REQUIRE(parse_delete_cascade("detach") == store::DeleteCascade::detach);
    REQUIRE(parse_delete_cascade("remove_faces") == store::DeleteCascade::remove_faces);
    REQUIRE_FALSE(parse_delete_cascade("cascade").has_value());
}
