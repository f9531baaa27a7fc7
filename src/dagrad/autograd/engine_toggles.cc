// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/engine_toggles.h"
#include <atomic>
#include <cstdlib>
#include <cstring>

namespace dagrad { namespace autograd {

namespace {

bool env_flag(const char* name, bool fallback) {
  const char* v = std::getenv(name);
  if (!v || !*v) return fallback;
  return std::strcmp(v, "0") != 0;
}

} // namespace

static std::atomic<bool> g_strict_leaf{env_flag("DAGRAD_AUTOGRAD_STRICT_LEAF", true)};
static std::atomic<bool> g_log_engine{env_flag("DAGRAD_LOG_AUTOGRAD_ENGINE", false)};

bool is_strict_leaf_accumulation_enabled() noexcept {
  return g_strict_leaf.load(std::memory_order_relaxed);
}

void set_strict_leaf_accumulation_enabled(bool v) noexcept {
  g_strict_leaf.store(v, std::memory_order_relaxed);
}

bool is_engine_logging_enabled() noexcept {
  return g_log_engine.load(std::memory_order_relaxed);
}

void set_engine_logging_enabled(bool v) noexcept {
  g_log_engine.store(v, std::memory_order_relaxed);
}

}} // namespace dagrad::autograd
