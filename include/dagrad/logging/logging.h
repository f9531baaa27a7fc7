// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <cassert>
#include <absl/log/log.h>
#include <absl/log/check.h>

namespace dagrad {
// Initialize Abseil logging once; optionally set min log level
// (0=INFO, 1=WARNING, 2=ERROR, 3=FATAL).
void InitLogging(std::optional<int> min_level);

// True once InitLogging has run in this process.
bool LoggingInitialized() noexcept;
}

#define DAGRAD_LOG(level) LOG(level)
#define DAGRAD_CHECK(cond) CHECK(cond)
#define DAGRAD_ASSERT(cond) assert(cond)
