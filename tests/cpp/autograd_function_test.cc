// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "dagrad/autograd/context.h"
#include "dagrad/autograd/errors.h"
#include "dagrad/autograd/function.h"
#include "dagrad/autograd/history.h"
#include "dagrad/autograd/scalar.h"
#include "scalar_test_ops.h"
#include "vec_test_kind.h"

using dagrad::autograd::ArityMismatch;
using dagrad::autograd::Context;
using dagrad::autograd::ContractViolation;
using dagrad::autograd::ErrorKind;
using dagrad::autograd::GradientPair;
using dagrad::autograd::History;
using dagrad::autograd::NodePtr;
using dagrad::autograd::Operand;
using dagrad::autograd::Payload;
using dagrad::autograd::ScalarFunction;
using dagrad::autograd::ScalarNode;
using dagrad::autograd::ScalarPtr;
using dagrad::autograd::TypeMismatch;
using dagrad::autograd::make_scalar;
using dagrad::autograd::payload_cast;
using dagrad_test::Add;
using dagrad_test::Mul;
using dagrad_test::Square;
using dagrad_test::as_double;

namespace {

// Kind of error raised by reading saved_values inside forward, if any.
thread_local std::optional<ErrorKind> tls_probe_error;

// Saves its input, then immediately tries to read it back.
struct SaveAndReadProbe : ScalarFunction<SaveAndReadProbe> {
  const char* name() const noexcept override { return "save_and_read_probe"; }
  Payload forward(Context& ctx, const std::vector<Payload>& in) const override {
    ctx.save_for_backward(in[0]);
    tls_probe_error.reset();
    try {
      (void)ctx.saved_values();
    } catch (const ContractViolation& e) {
      tls_probe_error = e.kind();
    }
    return as_double(in[0]);
  }
  std::vector<Payload> backward(const Context&, const Payload& d) const override {
    return {d};
  }
};

// Declares double but produces int.
struct WrongPayloadType : ScalarFunction<WrongPayloadType> {
  const char* name() const noexcept override { return "wrong_payload_type"; }
  Payload forward(Context&, const std::vector<Payload>&) const override { return 1; }
  std::vector<Payload> backward(const Context&, const Payload& d) const override {
    return {d};
  }
};

// Binary forward whose backward forgets the second operand.
struct ShortGradient : ScalarFunction<ShortGradient> {
  const char* name() const noexcept override { return "short_gradient"; }
  Payload forward(Context&, const std::vector<Payload>& in) const override {
    return as_double(in[0]) - as_double(in[1]);
  }
  std::vector<Payload> backward(const Context&, const Payload& d) const override {
    return {d};
  }
};

} // anonymous namespace

TEST(AutogradFunctionTest, AllConstantOperandsRecordNoHistory) {
  ScalarPtr out = Add::call(3.0, 5.0);
  EXPECT_DOUBLE_EQ(out->item(), 8.0);
  EXPECT_TRUE(out->is_leaf());
  EXPECT_EQ(out->history(), nullptr);
  EXPECT_FALSE(out->requires_grad());
}

TEST(AutogradFunctionTest, UntrackedLeavesCountAsConstants) {
  ScalarPtr a = make_scalar(3.0, "a", /*requires_grad=*/false);
  ScalarPtr b = make_scalar(5.0, "b", /*requires_grad=*/false);
  ScalarPtr out = Mul::call(a, b);
  EXPECT_DOUBLE_EQ(out->item(), 15.0);
  EXPECT_EQ(out->history(), nullptr);
  EXPECT_EQ(a->use_count(), 1u);
  EXPECT_EQ(b->use_count(), 1u);
}

TEST(AutogradFunctionTest, FrozenContextRejectsSavedValues) {
  ScalarPtr out = SaveAndReadProbe::call(2.0);
  EXPECT_EQ(out->history(), nullptr);
  ASSERT_TRUE(tls_probe_error.has_value());
  EXPECT_EQ(*tls_probe_error, ErrorKind::GradientOnFrozenContext);
}

TEST(AutogradFunctionTest, TrackedContextKeepsSavedValues) {
  ScalarPtr a = make_scalar(2.0);
  ScalarPtr out = SaveAndReadProbe::call(a);
  EXPECT_FALSE(tls_probe_error.has_value());
  ASSERT_NE(out->history(), nullptr);
  const Context& ctx = out->history()->context();
  EXPECT_FALSE(ctx.no_grad());
  EXPECT_DOUBLE_EQ(ctx.saved<double>(), 2.0);
}

TEST(AutogradFunctionTest, HistoryKeepsOriginalOperands) {
  ScalarPtr a = make_scalar(4.0, "a");
  ScalarPtr out = Mul::call(a, 0.5);
  EXPECT_DOUBLE_EQ(out->item(), 2.0);
  const History* h = out->history();
  ASSERT_NE(h, nullptr);
  EXPECT_EQ(&h->operation(), &Mul::get());
  EXPECT_STREQ(h->operation().name(), "mul");

  const std::vector<Operand>& in = h->inputs();
  ASSERT_EQ(in.size(), 2u);
  ASSERT_TRUE(in[0].is_node());
  EXPECT_EQ(in[0].node().get(), a.get());
  EXPECT_FALSE(in[0].is_constant());
  EXPECT_FALSE(in[1].is_node());
  EXPECT_TRUE(in[1].is_constant());
  EXPECT_DOUBLE_EQ(payload_cast<double>(in[1].raw()), 0.5);
}

TEST(AutogradFunctionTest, DerivedOperandPropagatesTracking) {
  ScalarPtr a = make_scalar(1.0);
  ScalarPtr b = Square::call(a);
  ScalarPtr c = Add::call(b, 1.0);
  EXPECT_NE(c->history(), nullptr);
  EXPECT_DOUBLE_EQ(c->item(), 2.0);
}

TEST(AutogradFunctionTest, WrongForwardTypeIsTypeMismatch) {
  ScalarPtr a = make_scalar(1.0);
  try {
    (void)WrongPayloadType::call(a);
    FAIL() << "expected TypeMismatch";
  } catch (const TypeMismatch& e) {
    EXPECT_EQ(e.kind(), ErrorKind::TypeMismatch);
    EXPECT_NE(std::string(e.what()).find("wrong_payload_type"), std::string::npos);
  }
}

TEST(AutogradFunctionTest, ChainRuleDropsConstantsKeepsTrackedLeaves) {
  ScalarPtr a = make_scalar(3.0, "a");
  ScalarPtr frozen = make_scalar(7.0, "frozen", /*requires_grad=*/false);
  std::vector<Operand> inputs{Operand(a), Operand(frozen)};

  Context ctx;
  ctx.save_for_backward(3.0, 7.0);
  std::vector<GradientPair> pairs = Mul::get().chain_rule(ctx, inputs, Payload(2.0));
  ASSERT_EQ(pairs.size(), 1u);
  EXPECT_EQ(pairs[0].node.get(), a.get());
  EXPECT_DOUBLE_EQ(as_double(pairs[0].derivative), 14.0);
}

TEST(AutogradFunctionTest, ChainRuleOrderMirrorsInputs) {
  ScalarPtr p = make_scalar(3.0, "p");
  ScalarPtr q = make_scalar(5.0, "q");
  ScalarPtr r = Mul::call(p, q);
  std::vector<GradientPair> pairs = r->history()->backprop_step(Payload(1.0));
  ASSERT_EQ(pairs.size(), 2u);
  EXPECT_EQ(pairs[0].node.get(), p.get());
  EXPECT_DOUBLE_EQ(as_double(pairs[0].derivative), 5.0);
  EXPECT_EQ(pairs[1].node.get(), q.get());
  EXPECT_DOUBLE_EQ(as_double(pairs[1].derivative), 3.0);
}

TEST(AutogradFunctionTest, ChainRuleArityMismatch) {
  ScalarPtr a = make_scalar(3.0);
  ScalarPtr b = make_scalar(1.0);
  ScalarPtr out = ShortGradient::call(a, b);
  EXPECT_DOUBLE_EQ(out->item(), 2.0);
  try {
    (void)out->history()->backprop_step(Payload(1.0));
    FAIL() << "expected ArityMismatch";
  } catch (const ArityMismatch& e) {
    EXPECT_EQ(e.kind(), ErrorKind::ArityMismatch);
    EXPECT_EQ(e.expected(), 2u);
    EXPECT_EQ(e.got(), 1u);
  }
}

TEST(AutogradFunctionTest, ChainRuleAppliesExpand) {
  using dagrad_test::BroadcastAdd;
  using dagrad_test::Vec;
  using dagrad_test::VecPtr;
  using dagrad_test::make_vec;

  VecPtr bias = make_vec(Vec{1.0}, "bias");
  VecPtr x = make_vec(Vec{1.0, 2.0, 3.0}, "x");
  VecPtr y = BroadcastAdd::call(x, bias);
  EXPECT_EQ(y->data(), (Vec{2.0, 3.0, 4.0}));

  std::vector<GradientPair> pairs = y->history()->backprop_step(Payload(Vec{1.0, 2.0, 3.0}));
  ASSERT_EQ(pairs.size(), 2u);
  EXPECT_EQ(payload_cast<Vec>(pairs[0].derivative), (Vec{1.0, 2.0, 3.0}));
  EXPECT_EQ(payload_cast<Vec>(pairs[1].derivative), (Vec{6.0}));
}

TEST(AutogradFunctionTest, OperationsAreSharedInstances) {
  ScalarPtr a = make_scalar(1.0);
  ScalarPtr s1 = Square::call(a);
  ScalarPtr s2 = Square::call(a);
  EXPECT_EQ(&s1->history()->operation(), &s2->history()->operation());
  EXPECT_NE(&s1->history()->context(), &s2->history()->context());
}

TEST(AutogradFunctionTest, ApplyAcceptsExplicitOperandList) {
  ScalarPtr a = make_scalar(2.0);
  NodePtr out = Add::get().apply({Operand(a), Operand(1.0)});
  ASSERT_NE(out, nullptr);
  EXPECT_DOUBLE_EQ(payload_cast<double>(out->value()), 3.0);
  EXPECT_FALSE(out->is_leaf());
}

TEST(AutogradFunctionTest, RawNodePointersAreNotConstants) {
  static_assert(!std::is_constructible_v<Operand, ScalarNode*>);
  static_assert(!std::is_constructible_v<Operand, const ScalarNode*>);
  static_assert(!std::is_constructible_v<Operand, dagrad::autograd::Node*>);
  static_assert(std::is_constructible_v<Operand, ScalarPtr>);
  static_assert(std::is_constructible_v<Operand, double>);

  ScalarPtr a = make_scalar(2.0);
  Operand op(a);
  EXPECT_TRUE(op.is_node());
  EXPECT_FALSE(Operand(2.0).is_node());
}
