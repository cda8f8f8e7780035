// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "net/SocketAddress.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <concepts>
#include <string>

/**
 * Formats a local socket address as its path; abstract socket names
 * and embedded null bytes are rendered as '@'.  Other address
 * families are rendered as "?".
 */
template<typename T>
requires std::convertible_to<T, SocketAddress>
struct fmt::formatter<T> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(SocketAddress address, FormatContext &ctx) const {
		std::string_view raw = address.GetLocalRaw();

		if (raw.empty())
			return formatter<string_view>::format("?", ctx);

		if (raw.front() != '\0' && raw.back() == '\0')
			/* don't convert the null terminator of a
			   non-abstract socket to a '@' */
			raw.remove_suffix(1);

		std::string s{raw};
		std::replace(s.begin(), s.end(), '\0', '@');

		return formatter<string_view>::format(s, ctx);
	}
};
