// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "dagrad/autograd/types.h"

namespace dagrad { namespace autograd {

// Per-apply scratch space. forward stashes what backward needs; when the
// invocation does not require grad, saves are dropped and reads are errors.
class Context {
 public:
  explicit Context(bool no_grad = false) noexcept : no_grad_(no_grad) {}

  Context(Context&&) noexcept = default;
  Context& operator=(Context&&) noexcept = default;
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  bool no_grad() const noexcept { return no_grad_; }

  // Replaces any previous save. No-op under no_grad.
  void save_for_backward(std::vector<Payload> values);

  template <class... Ts>
  void save_for_backward(Ts&&... values) {
    if (no_grad_) return;
    std::vector<Payload> v;
    v.reserve(sizeof...(Ts));
    (v.emplace_back(std::forward<Ts>(values)), ...);
    save_for_backward(std::move(v));
  }

  bool has_saved_values() const noexcept { return saved_.has_value(); }

  // Throws ContractViolation (GradientOnFrozenContext / UnsavedContext).
  const std::vector<Payload>& saved_values() const;

  // Element i of saved_values(); the lone value for single saves.
  const Payload& saved_value(std::size_t i = 0) const;

  template <class T>
  const T& saved(std::size_t i = 0) const {
    return payload_cast<T>(saved_value(i));
  }

 private:
  bool no_grad_;
  std::optional<std::vector<Payload>> saved_;
};

}} // namespace dagrad::autograd
