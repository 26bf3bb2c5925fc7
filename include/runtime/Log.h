/***
 * Name: PYBUF_RT_LOG
 * Purpose: Debug logging for the runtime, gated by the configured debug level.
 * Theory of Operation: Lines go to stderr with a "[runtime]" prefix, the same
 *   format the rest of the runtime uses for PYBUF_RT_DEBUG output.
 */
#pragma once

#include <cstdio>
#include "runtime/Config.h"

#define PYBUF_RT_LOG(level, ...) \
  do { \
    if (::pybuf::rt::debug_level() >= (level)) { \
      std::fprintf(stderr, "[runtime] "); \
      std::fprintf(stderr, __VA_ARGS__); \
      std::fputc('\n', stderr); \
    } \
  } while (0)
