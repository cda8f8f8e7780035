// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <algorithm>
#include <chrono>

/**
 * Configuration for #ExponentialBackoff.
 */
struct ExponentialBackoffConfig {
	std::chrono::steady_clock::duration min_delay;
	std::chrono::steady_clock::duration max_delay;
};

/**
 * Simple implementation of the Exponential Backoff algorithm: each
 * time an operation has to be retried, the delay doubles until it
 * reaches the configured maximum.
 */
class ExponentialBackoff {
	const ExponentialBackoffConfig config;

	/**
	 * The delay for the next retry.
	 */
	std::chrono::steady_clock::duration delay;

public:
	constexpr explicit ExponentialBackoff(const ExponentialBackoffConfig _config) noexcept
		:config(_config), delay(config.min_delay) {}

	/**
	 * The operation has made progress; start over with the
	 * minimum delay next time.
	 */
	constexpr void Reset() noexcept {
		delay = config.min_delay;
	}

	/**
	 * Return the delay to be used for this retry and double it
	 * for the next one.
	 */
	constexpr std::chrono::steady_clock::duration Next() noexcept {
		const auto result = delay;
		delay = std::min(delay * 2, config.max_delay);
		return result;
	}
};
