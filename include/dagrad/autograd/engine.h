// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "dagrad/autograd/node.h"
#include "dagrad/autograd/types.h"

namespace dagrad { namespace autograd {

// State of a single backward run. Owned by the run; discarded afterwards.
struct GraphTask {
  // Reverse DFS post-order from the root: every node after all its consumers.
  std::vector<Node*> topo;

  // Upstream derivative accumulated so far, keyed by node id.
  std::unordered_map<NodeId, Payload> pending;

  // E(n): in-graph edges pointing at n. R(n): contributions received so far.
  std::unordered_map<NodeId, std::size_t> dependencies;
  std::unordered_map<NodeId, std::size_t> received;

  std::size_t nodes_processed{0};
  std::size_t edges_processed{0};
  std::size_t leaves_accumulated{0};
  std::size_t contributions_coalesced{0};
};

// Single-threaded reverse-mode engine. External callers use the free
// backward() entrypoint below or Node::backward.
class Engine {
 public:
  static Engine& get_default_engine() noexcept;

  // Propagates seed (root->ones() when absent) from root to every reachable
  // grad-tracking leaf, adding into their derivative accumulators.
  void run_backward(const NodePtr& root, std::optional<Payload> seed = std::nullopt);

 private:
  Engine() = default;
  ~Engine() = default;
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
};

void backward(const NodePtr& root);
void backward(const NodePtr& root, Payload seed);

#if DAGRAD_AUTOGRAD_TESTING
// Test-only: ids of the nodes processed by the last successful backward on
// this thread, in processing order.
std::vector<NodeId> _test_last_backward_order();
#endif

}} // namespace dagrad::autograd
