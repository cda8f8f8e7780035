// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <array>
#include <exception>
#include <span>
#include <string>
#include <string_view>

/*
 * Log levels:
 *
 * 1 = errors which are reported to the user anyway
 * 2 = operations which failed after they had been suspended
 * 3 = connection setup
 * 4 = suspending and resuming operations
 * 5 = tracing
 */

namespace LoggerDetail {

extern unsigned max_level;

[[gnu::pure]]
inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

/*
 * Overloads which convert a LogConcat() parameter to a string.  The
 * "storage" parameter may be used to hold a temporary string; it
 * lives until the message has been written.
 */

inline std::string_view
ToLogString(std::string_view s, std::string &) noexcept
{
	return s;
}

inline std::string_view
ToLogString(const char *s, std::string &) noexcept
{
	return s;
}

inline std::string_view
ToLogString(const std::string &s, std::string &) noexcept
{
	return s;
}

std::string_view
ToLogString(std::exception_ptr ep, std::string &storage) noexcept;

std::string_view
ToLogString(int value, std::string &storage) noexcept;

std::string_view
ToLogString(unsigned value, std::string &storage) noexcept;

/**
 * Write one line to stderr, prefixed with the domain.
 */
void
WriteV(std::string_view domain,
       std::span<const std::string_view> buffers) noexcept;

template<typename... Params>
void
LogConcat(unsigned level, std::string_view domain,
	  const Params &...params) noexcept
{
	if (!CheckLevel(level))
		return;

	std::array<std::string, sizeof...(Params)> storage;
	std::size_t i = 0;

	/* a braced initializer list is evaluated from left to right */
	const std::array<std::string_view, sizeof...(Params)> values{
		ToLogString(params, storage[i++])...
	};

	WriteV(domain, values);
}

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} // namespace LoggerDetail

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

/**
 * A logger with a literal string as its domain.  Messages are only
 * formatted if the level is enabled.
 */
class LLogger {
	std::string_view domain;

public:
	constexpr explicit LLogger(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	/**
	 * Concatenate all parameters to one line.
	 */
	template<typename... Params>
	void operator()(unsigned level, const Params &...params) const noexcept {
		LoggerDetail::LogConcat(level, domain, params...);
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, domain, format_str,
				  fmt::make_format_args(args...));
	}
};
