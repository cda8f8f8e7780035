// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

namespace Event {

/**
 * The clock used by classes #EventLoop and #TimerEvent.
 */
using Clock = std::chrono::steady_clock;

using Duration = Clock::duration;
using TimePoint = Clock::time_point;

/**
 * A negative duration means "wait forever".
 */
static constexpr Duration NO_TIMEOUT{-1};

/**
 * Convert a number of seconds (as used by command lines and
 * configuration files) to a #Duration.  Negative values are mapped
 * to #NO_TIMEOUT.
 */
constexpr Duration
FromSeconds(double seconds) noexcept
{
	if (seconds < 0)
		return NO_TIMEOUT;

	return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds));
}

} // namespace Event
