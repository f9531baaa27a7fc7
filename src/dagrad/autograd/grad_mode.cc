// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/grad_mode.h"

namespace dagrad { namespace autograd {

thread_local bool tls_grad_enabled = true;

}} // namespace dagrad::autograd
