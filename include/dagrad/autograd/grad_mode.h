// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <type_traits>

namespace dagrad { namespace autograd {

// GradMode TLS and guards. While grad mode is off, apply records no history.
extern thread_local bool tls_grad_enabled;

struct NoGradGuard {
  bool prev_;
  NoGradGuard() noexcept : prev_(tls_grad_enabled) { tls_grad_enabled = false; }
  ~NoGradGuard() noexcept { tls_grad_enabled = prev_; }
  NoGradGuard(const NoGradGuard&) = delete;
  NoGradGuard& operator=(const NoGradGuard&) = delete;
};
struct EnableGradGuard {
  bool prev_;
  EnableGradGuard() noexcept : prev_(tls_grad_enabled) { tls_grad_enabled = true; }
  ~EnableGradGuard() noexcept { tls_grad_enabled = prev_; }
  EnableGradGuard(const EnableGradGuard&) = delete;
  EnableGradGuard& operator=(const EnableGradGuard&) = delete;
};
struct GradMode {
  static bool is_enabled() noexcept { return tls_grad_enabled; }
  static void set_enabled(bool v) noexcept { tls_grad_enabled = v; }
};
static_assert(noexcept(NoGradGuard()), "NoGradGuard ctor must be noexcept");
static_assert(std::is_nothrow_destructible_v<NoGradGuard>, "NoGradGuard dtor must be noexcept");
static_assert(noexcept(EnableGradGuard()), "EnableGradGuard ctor must be noexcept");
static_assert(std::is_nothrow_destructible_v<EnableGradGuard>, "EnableGradGuard dtor must be noexcept");

}} // namespace dagrad::autograd
