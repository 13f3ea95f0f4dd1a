// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/core/time.h"

#include <utility>

#include "lumen/core/log.h"

namespace lumen::time
{

using namespace std::chrono;

ScopedTimer::ScopedTimer(std::string label) : m_label(std::move(label)), m_begin(Clock::now()) {}

ScopedTimer::~ScopedTimer()
{
    LUMEN_LOG_INFO("[timer] {} took {:.3f} ms", m_label, elapsed_ms());
}

double ScopedTimer::elapsed_ms() const
{
    return duration_cast<duration<double, std::milli>>(Clock::now() - m_begin).count();
}

} // namespace lumen::time
