// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketAddress.hxx"

#include <stddef.h>
#include <string.h>
#include <sys/un.h>

std::string_view
SocketAddress::GetLocalRaw() const noexcept
{
	if (IsNull() || GetFamily() != AF_LOCAL)
		/* not applicable */
		return {};

	const auto sun = (const struct sockaddr_un *)GetAddress();
	const auto start = (const char *)sun;
	const auto path = sun->sun_path;
	const size_t header_size = path - start;
	if (size < header_size)
		/* malformed */
		return {};

	return {path, size - header_size};
}

const char *
SocketAddress::GetLocalPath() const noexcept
{
	const auto raw = GetLocalRaw();
	return !raw.empty() &&
		/* must be an absolute path */
		raw.front() != '\0' &&
		/* must be null-terminated and there must not be any
		   other null byte */
		raw.find('\0') == raw.size() - 1
		? raw.data()
		: nullptr;
}

bool
SocketAddress::operator==(SocketAddress other) const noexcept
{
	return size == other.size &&
		(size == 0 || memcmp(address, other.address, size) == 0);
}
