// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace lumen::time {

using Clock = std::chrono::steady_clock;

/// Scoped timer, logs the elapsed time when destroyed
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    double elapsed_ms() const;

private:
    std::string m_label;
    Clock::time_point m_begin;
};

} // namespace lumen::time
