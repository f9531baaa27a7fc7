// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace dagrad { namespace core {

inline constexpr const char* kSavedValuesFrozenMsg =
    "saved_values: context does not require grad (nothing is saved under no_grad)";

inline constexpr const char* kSavedValuesUnsavedMsg =
    "saved_values: nothing was saved; did forward forget save_for_backward?";

inline constexpr const char* kSavedValueIndexPrefix =
    "saved_value: index out of range: ";

inline constexpr const char* kForwardTypeMismatchPrefix =
    "apply: forward returned the wrong payload type for ";

inline constexpr const char* kBackwardArityPrefix =
    "chain_rule: wrong number of gradients from ";

inline constexpr const char* kNonLeafAccumulationMsg =
    "accumulate_derivative: only leaf nodes accumulate derivatives";

inline constexpr const char* kNonLeafRequiresGradMsg =
    "set_requires_grad: grad tracking can only be changed on leaf nodes";

inline constexpr const char* kPayloadCastPrefix =
    "payload type mismatch: ";

inline constexpr const char* kBackwardNullRootMsg =
    "engine: backward root must not be null";

inline constexpr const char* kBackwardConstantRootMsg =
    "engine: backward root does not require grad";

inline constexpr const char* kBackwardUnmanagedRootMsg =
    "backward: node is not owned by an intrusive_ptr";

}} // namespace dagrad::core
