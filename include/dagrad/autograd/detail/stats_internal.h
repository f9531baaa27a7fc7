// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>

namespace dagrad { namespace autograd {

// Internal bumpers used by Engine and Operation::apply. Not part of public API.
void _stats_bump_engine(std::uint64_t nodes, std::uint64_t edges,
                        std::uint64_t leaves, std::uint64_t coalesced) noexcept;
void _stats_function_applied(bool recorded_history) noexcept;

}} // namespace dagrad::autograd
