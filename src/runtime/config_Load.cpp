/***
 * Name: pybuf::rt (runtime config)
 * Purpose: Parse, cache and override the runtime configuration.
 * Theory of Operation:
 *   parse_runtime_config is pure over its lookup function and throws
 *   ConfigError. runtime_config() parses std::getenv once; a malformed
 *   environment is reported on stderr and the defaults are used, since there is
 *   no caller to propagate to from deep inside logging or validation.
 */
#include "runtime/Config.h"
#include "pybuf/exceptions/config_error.h"
#include "pybuf/support/parse.h"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace pybuf::rt {

static std::mutex g_cfg_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static RuntimeConfig g_cfg; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static bool g_cfg_loaded = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<int> g_debug_level{-1}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables) -1 = not loaded
static std::atomic<int> g_validation{-1}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables) ValidationMode, -1 = not loaded

// Caller holds g_cfg_mu.
static void publish_locked(const RuntimeConfig& cfg) {
  g_cfg = cfg;
  g_cfg_loaded = true;
  g_debug_level.store(cfg.debugLevel, std::memory_order_relaxed);
  g_validation.store(static_cast<int>(cfg.validation), std::memory_order_relaxed);
}

static ValidationMode parse_validation_mode(std::string_view raw) {
  const std::string_view text = support::TrimSpaces(raw);
  if (text == "debug") { return ValidationMode::Debug; }
  if (text == "always") { return ValidationMode::Always; }
  if (text == "never") { return ValidationMode::Never; }
  throw exceptions::ConfigError("PYBUF_VALIDATE: expected debug, always or never, got '" + std::string(raw) + "'");
}

RuntimeConfig parse_runtime_config(const EnvLookup& lookup) {
  RuntimeConfig cfg;
  if (const char* debug = lookup("PYBUF_RT_DEBUG"); debug != nullptr) {
    std::string err;
    int level = 0;
    if (!support::ParseLevel(debug, level, &err)) {
      throw exceptions::ConfigError("PYBUF_RT_DEBUG: " + err + " ('" + std::string(debug) + "')");
    }
    cfg.debugLevel = level;
  }
  if (const char* mode = lookup("PYBUF_VALIDATE"); mode != nullptr) {
    cfg.validation = parse_validation_mode(mode);
  }
  return cfg;
}

RuntimeConfig runtime_config() {
  const std::lock_guard<std::mutex> lock(g_cfg_mu);
  if (!g_cfg_loaded) {
    RuntimeConfig loaded;
    try {
      loaded = parse_runtime_config([](const char* name) { return std::getenv(name); });
    } catch (const exceptions::ConfigError& e) {
      std::fprintf(stderr, "[runtime] ignoring malformed environment: %s\n", e.what());
    }
    publish_locked(loaded);
  }
  return g_cfg;
}

void set_runtime_config(const RuntimeConfig& cfg) {
  const std::lock_guard<std::mutex> lock(g_cfg_mu);
  publish_locked(cfg);
}

int debug_level() {
  const int level = g_debug_level.load(std::memory_order_relaxed);
  if (level >= 0) { return level; }
  return runtime_config().debugLevel;
}

bool validation_enabled() {
  const int cached = g_validation.load(std::memory_order_relaxed);
  const ValidationMode mode = cached >= 0 ? static_cast<ValidationMode>(cached) : runtime_config().validation;
  switch (mode) {
    case ValidationMode::Always: return true;
    case ValidationMode::Never: return false;
    case ValidationMode::Debug: break;
  }
#ifdef NDEBUG
  return false;
#else
  return true;
#endif
}

} // namespace pybuf::rt
