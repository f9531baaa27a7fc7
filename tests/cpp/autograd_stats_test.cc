// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "dagrad/autograd/engine.h"
#include "dagrad/autograd/engine_toggles.h"
#include "dagrad/autograd/grad_mode.h"
#include "dagrad/autograd/scalar.h"
#include "dagrad/autograd/stats.h"
#include "dagrad/logging/logging.h"
#include "scalar_test_ops.h"

using dagrad::autograd::AutogradStatsSnapshot;
using dagrad::autograd::ScalarPtr;
using dagrad::autograd::backward;
using dagrad::autograd::make_scalar;
using dagrad::autograd::reset_stats;
using dagrad::autograd::stats;
using dagrad_test::Add;
using dagrad_test::Mul;
using dagrad_test::Square;

TEST(AutogradStats, ApplyCounters) {
  reset_stats();
  ScalarPtr a = make_scalar(2.0);
  AutogradStatsSnapshot before = stats();
  ScalarPtr b = Square::call(a);
  ScalarPtr c = Add::call(1.0, 2.0);
  {
    dagrad::autograd::NoGradGuard ng;
    ScalarPtr d = Square::call(a);
    (void)d;
  }
  AutogradStatsSnapshot after = stats();
  EXPECT_EQ(after.functions_applied, before.functions_applied + 3);
  EXPECT_EQ(after.histories_recorded, before.histories_recorded + 1);
  EXPECT_EQ(after.no_grad_applies, before.no_grad_applies + 2);
  (void)b;
  (void)c;
}

TEST(AutogradStats, EngineRunCounters) {
  // x feeds y twice (coalesced once at x) and z once.
  ScalarPtr x = make_scalar(1.0, "x");
  ScalarPtr y = Mul::call(x, x);
  ScalarPtr z = Add::call(y, x);

  reset_stats();
  AutogradStatsSnapshot before = stats();
  backward(z);
  AutogradStatsSnapshot after = stats();

  EXPECT_EQ(after.engine_runs, before.engine_runs + 1);
  EXPECT_EQ(after.engine_nodes_processed, before.engine_nodes_processed + 3);
  EXPECT_EQ(after.engine_edges_processed, before.engine_edges_processed + 4);
  EXPECT_EQ(after.engine_leaves_accumulated, before.engine_leaves_accumulated + 1);
  EXPECT_EQ(after.engine_contributions_coalesced, before.engine_contributions_coalesced + 2);
  EXPECT_DOUBLE_EQ(x->grad(), 3.0);
}

TEST(AutogradStats, EngineLoggingToggle) {
  dagrad::InitLogging(std::nullopt);
  const bool prev = dagrad::autograd::is_engine_logging_enabled();
  dagrad::autograd::set_engine_logging_enabled(true);
  EXPECT_TRUE(dagrad::autograd::is_engine_logging_enabled());

  ScalarPtr a = make_scalar(2.0, "logged");
  ScalarPtr b = Square::call(a);
  EXPECT_NO_THROW(backward(b));
  EXPECT_DOUBLE_EQ(a->grad(), 4.0);

  dagrad::autograd::set_engine_logging_enabled(prev);
}

TEST(AutogradStats, ResetClearsCounters) {
  ScalarPtr a = make_scalar(2.0);
  backward(Square::call(a));
  reset_stats();
  AutogradStatsSnapshot s = stats();
  EXPECT_EQ(s.engine_runs, 0u);
  EXPECT_EQ(s.engine_nodes_processed, 0u);
  EXPECT_EQ(s.functions_applied, 0u);
}
