// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

// Common types
namespace lumen
{

using u32 = uint32_t;

using usize = size_t;

} // namespace lumen
