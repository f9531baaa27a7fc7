// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <any>
#include <cstdint>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "dagrad/core/error_text.h"
#include "dagrad/core/intrusive_ptr.h"
#include "dagrad/autograd/errors.h"

namespace dagrad { namespace autograd {

class Node; // fwd

// Opaque value carried by nodes, saved in contexts and exchanged as gradients.
// Only the node kind that owns a payload interprets it.
using Payload = std::any;

using NodeId = std::uint64_t;
using NodePtr = dagrad::core::intrusive_ptr<Node>;

// Human-readable name of a payload's runtime type (demangling not attempted).
std::string payload_type_name(const Payload& p);

// Typed access to a payload; throws TypeMismatch on a wrong runtime type.
template <class T>
const T& payload_cast(const Payload& p) {
  const T* v = std::any_cast<T>(&p);
  if (!v) {
    throw TypeMismatch(std::string(dagrad::core::kPayloadCastPrefix) + "expected " + typeid(T).name() +
                       ", got " + payload_type_name(p));
  }
  return *v;
}

template <class T>
T& payload_cast(Payload& p) {
  T* v = std::any_cast<T>(&p);
  if (!v) {
    throw TypeMismatch(std::string(dagrad::core::kPayloadCastPrefix) + "expected " + typeid(T).name() +
                       ", got " + payload_type_name(p));
  }
  return *v;
}

// One argument to Operation::apply: either a graph node or a raw constant.
class Operand {
 public:
  template <class U, class = std::enable_if_t<std::is_convertible_v<U*, Node*>>>
  Operand(const dagrad::core::intrusive_ptr<U>& node) : v_(NodePtr(node)) {}

  template <class T,
            class = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Operand> &&
                                     !dagrad::core::is_intrusive_ptr<std::decay_t<T>>::value &&
                                     !std::is_convertible_v<std::decay_t<T>, const Node*>>>
  Operand(T&& constant) : v_(Payload(std::forward<T>(constant))) {}

  bool is_node() const noexcept { return std::holds_alternative<NodePtr>(v_); }
  const NodePtr& node() const { return std::get<NodePtr>(v_); }

  // Node value for node operands, the constant itself otherwise.
  const Payload& raw() const;

  // True for raw constants and for leaves that do not track gradients. Such
  // operands never enter a backward traversal.
  bool is_constant() const noexcept;

 private:
  std::variant<NodePtr, Payload> v_;
};

// One chain-rule contribution: the operand that receives it and its value.
struct GradientPair {
  NodePtr node;
  Payload derivative;
};

}} // namespace dagrad::autograd
