// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/node.h"

#include "dagrad/autograd/engine.h"
#include "dagrad/autograd/engine_toggles.h"
#include "dagrad/core/error_text.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace dagrad { namespace autograd {

IdAllocator& IdAllocator::global() noexcept {
  static IdAllocator instance;  // C++11 thread-safe initialization
  return instance;
}

Node::Node(Payload value, std::unique_ptr<History> history, std::string name)
    : id_(IdAllocator::global().next()),
      value_(std::move(value)),
      history_(std::move(history)),
      name_(std::move(name)) {
  if (name_.empty()) {
    name_ = "node_" + std::to_string(id_);
  }
}

Node::~Node() = default;

void Node::set_requires_grad(bool v) {
  if (!is_leaf()) {
    throw ContractViolation(ErrorKind::NonLeafMutation, dagrad::core::kNonLeafRequiresGradMsg);
  }
  requires_grad_ = v;
}

void Node::accumulate_derivative(const Payload& delta) {
  if (!is_leaf() && is_strict_leaf_accumulation_enabled()) {
    throw ContractViolation(ErrorKind::NonLeafAccumulation,
                            std::string(dagrad::core::kNonLeafAccumulationMsg) + " (" + name_ + ")");
  }
  if (!derivative_) {
    // First contribution: stays absent if the add throws.
    Payload acc = zero();
    add_inplace(acc, delta);
    derivative_ = std::move(acc);
    return;
  }
  add_inplace(*derivative_, delta);
}

void Node::zero_derivative() {
  derivative_ = zero();
}

NodePtr Node::self_handle() {
  if (refcount() == 0) {
    throw std::logic_error(std::string(dagrad::core::kBackwardUnmanagedRootMsg) + " (" + name_ + ")");
  }
  return NodePtr(this);
}

void Node::backward() {
  Engine::get_default_engine().run_backward(self_handle());
}

void Node::backward(Payload seed) {
  Engine::get_default_engine().run_backward(self_handle(), std::move(seed));
}

// Operand lives in types.h but needs the complete Node.

const Payload& Operand::raw() const {
  if (const NodePtr* n = std::get_if<NodePtr>(&v_)) {
    return (*n)->value();
  }
  return std::get<Payload>(v_);
}

bool Operand::is_constant() const noexcept {
  const NodePtr* n = std::get_if<NodePtr>(&v_);
  return n == nullptr || !*n || !(*n)->requires_grad();
}

}} // namespace dagrad::autograd
