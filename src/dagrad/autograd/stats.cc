// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/stats.h"
#include "dagrad/autograd/detail/stats_internal.h"
#include <atomic>

namespace dagrad { namespace autograd {

static std::atomic<std::uint64_t> g_engine_runs{0};
static std::atomic<std::uint64_t> g_engine_nodes{0};
static std::atomic<std::uint64_t> g_engine_edges{0};
static std::atomic<std::uint64_t> g_engine_leaves{0};
static std::atomic<std::uint64_t> g_engine_coalesced{0};
static std::atomic<std::uint64_t> g_fn_applied{0};
static std::atomic<std::uint64_t> g_fn_histories{0};
static std::atomic<std::uint64_t> g_fn_no_grad{0};

AutogradStatsSnapshot stats() noexcept {
  AutogradStatsSnapshot s;
  s.engine_runs = g_engine_runs.load(std::memory_order_relaxed);
  s.engine_nodes_processed = g_engine_nodes.load(std::memory_order_relaxed);
  s.engine_edges_processed = g_engine_edges.load(std::memory_order_relaxed);
  s.engine_leaves_accumulated = g_engine_leaves.load(std::memory_order_relaxed);
  s.engine_contributions_coalesced = g_engine_coalesced.load(std::memory_order_relaxed);
  s.functions_applied = g_fn_applied.load(std::memory_order_relaxed);
  s.histories_recorded = g_fn_histories.load(std::memory_order_relaxed);
  s.no_grad_applies = g_fn_no_grad.load(std::memory_order_relaxed);
  return s;
}

void reset_stats() noexcept {
  g_engine_runs.store(0, std::memory_order_relaxed);
  g_engine_nodes.store(0, std::memory_order_relaxed);
  g_engine_edges.store(0, std::memory_order_relaxed);
  g_engine_leaves.store(0, std::memory_order_relaxed);
  g_engine_coalesced.store(0, std::memory_order_relaxed);
  g_fn_applied.store(0, std::memory_order_relaxed);
  g_fn_histories.store(0, std::memory_order_relaxed);
  g_fn_no_grad.store(0, std::memory_order_relaxed);
}

void _stats_bump_engine(std::uint64_t nodes, std::uint64_t edges,
                        std::uint64_t leaves, std::uint64_t coalesced) noexcept {
  g_engine_runs.fetch_add(1, std::memory_order_relaxed);
  g_engine_nodes.fetch_add(nodes, std::memory_order_relaxed);
  g_engine_edges.fetch_add(edges, std::memory_order_relaxed);
  g_engine_leaves.fetch_add(leaves, std::memory_order_relaxed);
  g_engine_coalesced.fetch_add(coalesced, std::memory_order_relaxed);
}

void _stats_function_applied(bool recorded_history) noexcept {
  g_fn_applied.fetch_add(1, std::memory_order_relaxed);
  if (recorded_history) {
    g_fn_histories.fetch_add(1, std::memory_order_relaxed);
  } else {
    g_fn_no_grad.fetch_add(1, std::memory_order_relaxed);
  }
}

}} // namespace dagrad::autograd
