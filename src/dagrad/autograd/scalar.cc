// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/scalar.h"

#include <utility>

namespace dagrad { namespace autograd {

ScalarNode::ScalarNode(Payload raw, std::unique_ptr<History> history, std::string name)
    : Node(std::move(raw), std::move(history), std::move(name)) {
  (void)payload_cast<double>(value());
}

double ScalarNode::grad() const {
  const auto& d = derivative();
  return d ? payload_cast<double>(*d) : 0.0;
}

void ScalarNode::add_inplace(Payload& acc, const Payload& delta) const {
  payload_cast<double>(acc) += payload_cast<double>(delta);
}

ScalarPtr make_scalar(double v, std::string name, bool requires_grad) {
  auto n = dagrad::core::make_intrusive<ScalarNode>(Payload(v), nullptr, std::move(name));
  n->set_requires_grad(requires_grad);
  return n;
}

}} // namespace dagrad::autograd
