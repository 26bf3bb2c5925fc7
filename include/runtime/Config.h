/***
 * Name: pybuf::rt::RuntimeConfig
 * Purpose: Process-wide runtime settings read from the environment.
 * Theory of Operation:
 *   - PYBUF_RT_DEBUG: non-negative debug level for PYBUF_RT_LOG (default 0).
 *   - PYBUF_VALIDATE: descriptor invariant checking, one of "debug" (checks
 *     follow the build type), "always" or "never" (default "debug").
 *   The config is parsed lazily on first use; set_runtime_config overrides it.
 *   debug_level() and validation_enabled() read atomically cached copies and
 *   may run concurrently with set_runtime_config.
 */
#pragma once

#include <functional>

namespace pybuf::rt {
    enum class ValidationMode { Debug, Always, Never };

    struct RuntimeConfig {
        int debugLevel{0};
        ValidationMode validation{ValidationMode::Debug};
    };

    using EnvLookup = std::function<const char *(const char *)>;

    // Throws exceptions::ConfigError naming the variable when a value is malformed.
    RuntimeConfig parse_runtime_config(const EnvLookup &lookup);

    // Snapshot of the current config.
    RuntimeConfig runtime_config();

    void set_runtime_config(const RuntimeConfig &cfg);

    // Cached debug level; cheap enough for per-call logging checks.
    int debug_level();

    // Resolve the validation mode against the build type (NDEBUG).
    bool validation_enabled();
} // namespace pybuf::rt
