// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/engine.h"

#include "dagrad/autograd/engine_toggles.h"
#include "dagrad/autograd/history.h"
#include "dagrad/autograd/detail/stats_internal.h"
#include "dagrad/core/error_text.h"
#include "dagrad/logging/logging.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace dagrad { namespace autograd {

static_assert(std::is_empty<Engine>::value,
              "Engine must remain stateless (no data members)");

namespace {

#if DAGRAD_AUTOGRAD_TESTING
thread_local std::vector<NodeId> tls_last_backward_order;
#endif

enum class VisitState : std::uint8_t { kWhite, kGray, kBlack };

// Fills gt.topo (reverse DFS post-order) and gt.dependencies. Edges run from a
// node to the non-constant operands recorded in its History; constants never
// enter the graph. Iterative so graph depth does not bound stack use.
void build_graph_topology(GraphTask& gt, Node* root) {
  std::unordered_map<Node*, VisitState> visit;

  struct Frame {
    Node* node;
    std::size_t input_idx;
  };

  std::vector<Frame> stack;
  stack.push_back({root, 0});
  gt.dependencies.emplace(root->id(), 0);

  while (!stack.empty()) {
    Frame& f = stack.back();
    Node* n = f.node;

    VisitState& state = visit[n];
    if (state == VisitState::kBlack) {
      stack.pop_back();
      continue;
    }
    state = VisitState::kGray;

    const History* h = n->history();
    if (h && f.input_idx < h->inputs().size()) {
      const Operand& in = h->inputs()[f.input_idx++];
      if (in.is_constant()) {
        continue;
      }
      Node* producer = in.node().get();
      ++gt.dependencies[producer->id()];  // bump E(producer)

      auto it = visit.find(producer);
      if (it == visit.end() || it->second == VisitState::kWhite) {
        stack.push_back({producer, 0});
      }
      continue;
    }

    // All operands processed for this node.
    state = VisitState::kBlack;
    gt.topo.push_back(n);
    stack.pop_back();
  }

  // Post-order lists producers before consumers; processing needs the reverse.
  std::reverse(gt.topo.begin(), gt.topo.end());
}

// pending[id] += contribution, starting from the node kind's zero.
void add_contribution(GraphTask& gt, Node* n, const Payload& contribution) {
  auto [it, inserted] = gt.pending.try_emplace(n->id());
  if (inserted) {
    it->second = n->zero();
  } else {
    ++gt.contributions_coalesced;
  }
  n->add_inplace(it->second, contribution);
}

} // namespace

Engine& Engine::get_default_engine() noexcept {
  static Engine instance;  // C++11 thread-safe initialization
  return instance;
}

void Engine::run_backward(const NodePtr& root, std::optional<Payload> seed) {
  if (!root) {
    throw std::invalid_argument(dagrad::core::kBackwardNullRootMsg);
  }
  if (!root->requires_grad()) {
    throw std::invalid_argument(std::string(dagrad::core::kBackwardConstantRootMsg) +
                                " (" + root->name() + ")");
  }

  GraphTask gt;
  build_graph_topology(gt, root.get());

  add_contribution(gt, root.get(), seed ? *seed : root->ones());

  // Leaf deltas are committed only after every backprop_step succeeded, so a
  // failed run leaves all derivative accumulators untouched.
  std::vector<std::pair<Node*, Payload>> leaf_deltas;

  for (Node* n : gt.topo) {
    const NodeId id = n->id();
    auto it = gt.pending.find(id);
    if (it == gt.pending.end()) {
      throw std::logic_error("engine: node " + n->name() + " reached without upstream derivative");
    }
    if (gt.received[id] != gt.dependencies[id]) {
      throw std::logic_error("engine: node " + n->name() +
                             " processed before all consumers contributed");
    }
    Payload d_output = std::move(it->second);
    gt.pending.erase(it);
    ++gt.nodes_processed;

    if (n->is_leaf()) {
      leaf_deltas.emplace_back(n, std::move(d_output));
      continue;
    }

    for (GradientPair& p : n->history()->backprop_step(d_output)) {
      Node* producer = p.node.get();
      ++gt.edges_processed;
      ++gt.received[producer->id()];
      add_contribution(gt, producer, p.derivative);
    }
  }

  for (auto& [leaf, delta] : leaf_deltas) {
    leaf->accumulate_derivative(delta);
    ++gt.leaves_accumulated;
  }

  if (is_engine_logging_enabled()) {
    DAGRAD_LOG(INFO) << "[autograd] run: root=" << root->name()
                     << " nodes=" << gt.nodes_processed
                     << " edges=" << gt.edges_processed
                     << " leaves=" << gt.leaves_accumulated
                     << " coalesced=" << gt.contributions_coalesced;
  }
  _stats_bump_engine(gt.nodes_processed, gt.edges_processed,
                     gt.leaves_accumulated, gt.contributions_coalesced);

#if DAGRAD_AUTOGRAD_TESTING
  tls_last_backward_order.clear();
  tls_last_backward_order.reserve(gt.topo.size());
  for (Node* n : gt.topo) {
    tls_last_backward_order.push_back(n->id());
  }
#endif
}

void backward(const NodePtr& root) {
  Engine::get_default_engine().run_backward(root);
}

void backward(const NodePtr& root, Payload seed) {
  Engine::get_default_engine().run_backward(root, std::move(seed));
}

#if DAGRAD_AUTOGRAD_TESTING
std::vector<NodeId> _test_last_backward_order() {
  return tls_last_backward_order;
}
#endif

}} // namespace dagrad::autograd
