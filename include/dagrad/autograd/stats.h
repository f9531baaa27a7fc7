// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>

namespace dagrad { namespace autograd {

struct AutogradStatsSnapshot {
  std::uint64_t engine_runs{0};
  std::uint64_t engine_nodes_processed{0};
  std::uint64_t engine_edges_processed{0};
  std::uint64_t engine_leaves_accumulated{0};
  std::uint64_t engine_contributions_coalesced{0};
  // Graph construction counters
  std::uint64_t functions_applied{0};
  std::uint64_t histories_recorded{0};
  std::uint64_t no_grad_applies{0};
};

// Return a best-effort snapshot of autograd counters (not atomic across fields).
AutogradStatsSnapshot stats() noexcept;

// Reset all counters to zero. Other threads may concurrently bump.
void reset_stats() noexcept;

}} // namespace dagrad::autograd
