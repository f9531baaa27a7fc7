// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/function.h"

#include "dagrad/autograd/grad_mode.h"
#include "dagrad/autograd/detail/stats_internal.h"
#include "dagrad/core/error_text.h"

#include <stdexcept>
#include <string>

namespace dagrad { namespace autograd {

NodePtr Operation::apply(std::vector<Operand> operands) const {
  std::vector<Payload> raw;
  raw.reserve(operands.size());
  bool need_grad = false;
  for (const Operand& op : operands) {
    if (op.is_node()) {
      const NodePtr& n = op.node();
      if (!n) {
        throw std::invalid_argument(std::string("apply: null node operand to ") + name());
      }
      if (n->requires_grad()) {
        need_grad = true;
      }
      n->mark_used();
    }
    raw.push_back(op.raw());
  }
  if (!GradMode::is_enabled()) {
    need_grad = false;
  }

  Context ctx(/*no_grad=*/!need_grad);
  Payload out = forward(ctx, raw);
  if (out.type() != payload_type()) {
    throw TypeMismatch(std::string(dagrad::core::kForwardTypeMismatchPrefix) + name() +
                       " (expected " + payload_type().name() + ", got " +
                       payload_type_name(out) + ")");
  }

  std::unique_ptr<History> history;
  if (need_grad) {
    history = std::make_unique<History>(*this, std::move(ctx), std::move(operands));
  }
  _stats_function_applied(history != nullptr);
  return variable(std::move(out), std::move(history));
}

std::vector<GradientPair> Operation::chain_rule(const Context& ctx,
                                                const std::vector<Operand>& inputs,
                                                const Payload& d_output) const {
  std::vector<Payload> d_inputs = backward(ctx, d_output);
  if (d_inputs.size() != inputs.size()) {
    throw ArityMismatch(inputs.size(), d_inputs.size(),
                        std::string(dagrad::core::kBackwardArityPrefix) + name() +
                            " (expected " + std::to_string(inputs.size()) + ", got " +
                            std::to_string(d_inputs.size()) + ")");
  }

  std::vector<GradientPair> out;
  out.reserve(inputs.size());
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    const Operand& in = inputs[i];
    if (in.is_constant()) {
      continue;
    }
    const NodePtr& n = in.node();
    out.push_back(GradientPair{n, n->expand(std::move(d_inputs[i]))});
  }
  return out;
}

}} // namespace dagrad::autograd
