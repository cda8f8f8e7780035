// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Caches the value of Clock::now().  The real clock is queried
 * lazily on the first now() call after flush().
 */
template<typename Clock>
class ClockCache {
	using time_point = typename Clock::time_point;

	mutable time_point value;

	mutable bool stale = true;

public:
	ClockCache() noexcept = default;

	ClockCache(const ClockCache &) = delete;
	ClockCache &operator=(const ClockCache &) = delete;

	[[gnu::pure]]
	const time_point &now() const noexcept {
		if (stale) {
			value = Clock::now();
			stale = false;
		}

		return value;
	}

	/**
	 * Forget the cached value; the next now() call queries the
	 * real clock.
	 */
	void flush() noexcept {
		stale = true;
	}
};
