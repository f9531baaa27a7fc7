// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <initializer_list>
#include <memory>
#include <typeinfo>
#include <utility>
#include <vector>

#include "dagrad/autograd/context.h"
#include "dagrad/autograd/history.h"
#include "dagrad/autograd/node.h"
#include "dagrad/autograd/types.h"

namespace dagrad { namespace autograd {

/**
 * Contract implemented by every differentiable operation.
 *
 * Operations are stateless and shared: a History keeps a plain reference to
 * the operation that produced its node, so an Operation must outlive every
 * graph built from it (use static storage; Function<> below provides one).
 * Everything forward needs to hand to backward goes through the Context.
 */
class Operation {
 public:
  virtual ~Operation() = default;

  virtual const char* name() const noexcept = 0;

  // Runtime type forward must return.
  virtual const std::type_info& payload_type() const noexcept = 0;

  // Pure function of the raw operand payloads; may call ctx.save_for_backward.
  virtual Payload forward(Context& ctx, const std::vector<Payload>& inputs) const = 0;

  // One gradient per forward operand, in operand order, constants included.
  virtual std::vector<Payload> backward(const Context& ctx, const Payload& d_output) const = 0;

  // Builds the node kind wrapping a forward result.
  virtual NodePtr variable(Payload raw, std::unique_ptr<History> history) const = 0;

  // Runs forward and records History when any operand requires grad.
  // Throws TypeMismatch when forward's result is not payload_type().
  NodePtr apply(std::vector<Operand> operands) const;

  // Converts d_output into (operand, contribution) pairs for the non-constant
  // operands. Throws ArityMismatch when backward's arity is off.
  std::vector<GradientPair> chain_rule(const Context& ctx,
                                       const std::vector<Operand>& inputs,
                                       const Payload& d_output) const;
};

// CRTP base tying an operation to the node kind it produces. Derived classes
// only provide name(), forward() and backward().
template <class Derived, class NodeKind>
class Function : public Operation {
 public:
  using node_type = NodeKind;
  using value_type = typename NodeKind::value_type;

  static const Derived& get() noexcept {
    static const Derived op{};
    return op;
  }

  template <class... Args>
  static dagrad::core::intrusive_ptr<NodeKind> call(Args&&... args) {
    NodePtr out = get().apply(std::vector<Operand>{Operand(std::forward<Args>(args))...});
    return dagrad::core::static_pointer_cast<NodeKind>(out);
  }

  const std::type_info& payload_type() const noexcept override { return typeid(value_type); }

  NodePtr variable(Payload raw, std::unique_ptr<History> history) const override {
    return dagrad::core::make_intrusive<NodeKind>(std::move(raw), std::move(history));
  }
};

}} // namespace dagrad::autograd
