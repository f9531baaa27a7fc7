// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dagrad { namespace autograd {

enum class ErrorKind : std::uint8_t {
  TypeMismatch,
  UnsavedContext,
  GradientOnFrozenContext,
  ArityMismatch,
  NonLeafAccumulation,
  NonLeafMutation,
};

const char* to_string(ErrorKind kind) noexcept;

// Base of every autograd programmer error. These never signal a transient
// condition; callers are not expected to retry.
class AutogradError : public std::logic_error {
 public:
  AutogradError(ErrorKind kind, const std::string& what)
      : std::logic_error(what), kind_(kind) {}
  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// forward result (or a payload handed to a node kind) has the wrong runtime type.
class TypeMismatch final : public AutogradError {
 public:
  explicit TypeMismatch(const std::string& what)
      : AutogradError(ErrorKind::TypeMismatch, what) {}
};

// Misuse of Context or Node state: UnsavedContext, GradientOnFrozenContext,
// NonLeafAccumulation or NonLeafMutation.
class ContractViolation final : public AutogradError {
 public:
  ContractViolation(ErrorKind kind, const std::string& what)
      : AutogradError(kind, what) {}
};

// backward returned a gradient count different from the recorded operand count.
class ArityMismatch final : public AutogradError {
 public:
  ArityMismatch(std::size_t expected, std::size_t got, const std::string& what)
      : AutogradError(ErrorKind::ArityMismatch, what), expected_(expected), got_(got) {}
  std::size_t expected() const noexcept { return expected_; }
  std::size_t got() const noexcept { return got_; }

 private:
  std::size_t expected_;
  std::size_t got_;
};

}} // namespace dagrad::autograd
