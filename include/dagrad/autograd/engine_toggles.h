// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace dagrad { namespace autograd {

// Initial values come from the environment, read once per process:
//   DAGRAD_AUTOGRAD_STRICT_LEAF=0  -> allow accumulate_derivative on non-leaves
//   DAGRAD_LOG_AUTOGRAD_ENGINE=1   -> log one summary line per backward run

bool is_strict_leaf_accumulation_enabled() noexcept;
void set_strict_leaf_accumulation_enabled(bool v) noexcept;

bool is_engine_logging_enabled() noexcept;
void set_engine_logging_enabled(bool v) noexcept;

}} // namespace dagrad::autograd
