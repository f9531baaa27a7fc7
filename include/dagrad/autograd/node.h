// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "dagrad/core/intrusive_ptr.h"
#include "dagrad/autograd/history.h"
#include "dagrad/autograd/types.h"

namespace dagrad { namespace autograd {

// Hands out node ids. Ids start at 1 and are never reused by one allocator.
class IdAllocator {
 public:
  IdAllocator() noexcept = default;
  IdAllocator(const IdAllocator&) = delete;
  IdAllocator& operator=(const IdAllocator&) = delete;

  NodeId next() noexcept { return next_.fetch_add(1, std::memory_order_relaxed); }
  NodeId peek() const noexcept { return next_.load(std::memory_order_relaxed); }

  // Process-wide allocator used by every Node constructor.
  static IdAllocator& global() noexcept;

 private:
  std::atomic<NodeId> next_{1};
};

// Vertex of the computation graph. Concrete node kinds implement the payload
// capabilities (zero, ones, add_inplace and optionally expand); the engine
// never touches payloads any other way.
class Node : public dagrad::core::IntrusiveRefcounted {
 public:
  Node(Payload value, std::unique_ptr<History> history, std::string name = {});
  ~Node() override;

  NodeId id() const noexcept { return id_; }
  const Payload& value() const noexcept { return value_; }
  const History* history() const noexcept { return history_.get(); }
  const std::string& name() const noexcept { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  bool is_leaf() const noexcept { return history_ == nullptr; }

  // Derived nodes always track gradients; leaves opt in.
  bool requires_grad() const noexcept { return requires_grad_ || history_ != nullptr; }
  void set_requires_grad(bool v);

  // Consumers recorded by apply so far (informational).
  std::uint64_t use_count() const noexcept { return used_.load(std::memory_order_relaxed); }
  void mark_used() noexcept { used_.fetch_add(1, std::memory_order_relaxed); }

  const std::optional<Payload>& derivative() const noexcept { return derivative_; }
  bool has_derivative() const noexcept { return derivative_.has_value(); }

  // derivative += delta, starting from zero() on the first contribution.
  void accumulate_derivative(const Payload& delta);

  // Reset the accumulator to zero().
  void zero_derivative();

  // Run a backward pass rooted here (seed defaults to ones()). The node must be
  // owned by an intrusive_ptr; throws std::logic_error otherwise.
  void backward();
  void backward(Payload seed);

  // Payload capabilities.
  virtual Payload zero() const = 0;
  virtual Payload ones() const = 0;
  virtual void add_inplace(Payload& acc, const Payload& delta) const = 0;
  virtual Payload expand(Payload delta) const { return delta; }

 private:
  NodePtr self_handle();

  NodeId id_;
  Payload value_;
  std::unique_ptr<History> history_;
  std::string name_;
  bool requires_grad_{false};
  std::atomic<std::uint64_t> used_{0};
  std::optional<Payload> derivative_;
};

}} // namespace dagrad::autograd
