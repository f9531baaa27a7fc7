// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <vector>

#include "dagrad/autograd/context.h"
#include "dagrad/autograd/types.h"

namespace dagrad { namespace autograd {

class Operation; // fwd

// Provenance of a derived node: the operation that produced it, the context
// of that invocation and the operands exactly as they were passed to apply.
// Immutable after construction; owned by the node it documents.
class History {
 public:
  History(const Operation& op, Context ctx, std::vector<Operand> inputs);
  ~History();

  History(const History&) = delete;
  History& operator=(const History&) = delete;

  const Operation& operation() const noexcept { return *op_; }
  const Context& context() const noexcept { return ctx_; }
  const std::vector<Operand>& inputs() const noexcept { return inputs_; }

  // One chain-rule step through the recorded operation.
  std::vector<GradientPair> backprop_step(const Payload& d_output) const;

 private:
  const Operation* op_;
  Context ctx_;
  std::vector<Operand> inputs_;
};

}} // namespace dagrad::autograd
