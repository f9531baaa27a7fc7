// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/logging/logging.h"
#include <atomic>
#include <mutex>
#include <absl/log/initialize.h>
#include <absl/log/globals.h>
#include <absl/base/log_severity.h>

namespace dagrad {
namespace {
std::once_flag g_once;
std::atomic<bool> g_initialized{false};
}

void InitLogging(std::optional<int> min_level) {
  std::call_once(g_once, [] {
    absl::InitializeLog();
    g_initialized.store(true, std::memory_order_release);
  });
  if (min_level) {
    absl::SetMinLogLevel(static_cast<absl::LogSeverityAtLeast>(
        absl::NormalizeLogSeverity(*min_level)));
  }
}

bool LoggingInitialized() noexcept {
  return g_initialized.load(std::memory_order_acquire);
}

}  // namespace dagrad
