// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <memory>
#include <string>

#include "dagrad/core/intrusive_ptr.h"
#include "dagrad/autograd/function.h"
#include "dagrad/autograd/node.h"

namespace dagrad { namespace autograd {

// Node kind over a double payload.
class ScalarNode final : public Node {
 public:
  using value_type = double;

  ScalarNode(Payload raw, std::unique_ptr<History> history, std::string name = {});

  double item() const { return payload_cast<double>(value()); }

  // Accumulated derivative, 0.0 when nothing has been accumulated yet.
  double grad() const;

  Payload zero() const override { return 0.0; }
  Payload ones() const override { return 1.0; }
  void add_inplace(Payload& acc, const Payload& delta) const override;
};

using ScalarPtr = dagrad::core::intrusive_ptr<ScalarNode>;

// User-created leaf; tracks gradients unless requires_grad is false.
ScalarPtr make_scalar(double v, std::string name = {}, bool requires_grad = true);

template <class Derived>
using ScalarFunction = Function<Derived, ScalarNode>;

}} // namespace dagrad::autograd
