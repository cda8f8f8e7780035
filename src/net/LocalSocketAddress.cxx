// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LocalSocketAddress.hxx"
#include "SocketDescriptor.hxx"
#include "SocketError.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>

#include <string.h>

LocalSocketAddress::LocalSocketAddress(SocketAddress src)
{
	if (src.IsNull() || src.GetSize() < HEADER_SIZE ||
	    src.GetFamily() != AF_LOCAL)
		throw std::invalid_argument{"Not a local socket address"};

	if (src.GetSize() > sizeof(address))
		throw std::invalid_argument{"Local socket address is too large"};

	memcpy(&address, src.GetAddress(), src.GetSize());
	size = src.GetSize();
}

inline void
LocalSocketAddress::SetFamily() noexcept
{
#ifdef HAVE_SUN_LEN
	address.sun_len = size;
#endif
	address.sun_family = AF_LOCAL;
}

void
LocalSocketAddress::SetLocal(std::string_view path)
{
	if (path.empty())
		throw std::invalid_argument{"Empty socket path"};

	const bool is_abstract = path.front() == '@';
#ifndef __linux__
	if (is_abstract)
		/* Linux specific feature */
		throw std::invalid_argument{"Abstract sockets supported only on Linux"};
#endif

	if (path.find('\0') != path.npos)
		throw std::invalid_argument{"Socket path contains a null byte"};

	const std::size_t new_size = GetEncodedSize(path);
	if (new_size > sizeof(address))
		throw std::length_error{fmt::format("Socket path is too long ({} bytes, maximum is {}): {}",
						    path.size(), MAX_PATH_LENGTH,
						    path)};

	size = new_size;
	SetFamily();

	char *p = std::copy(path.begin(), path.end(), address.sun_path);
	if (is_abstract)
		address.sun_path[0] = '\0';
	else
		*p = '\0';
}

std::string
LocalSocketAddress::GetPath() const
{
	const auto raw = GetLocalRaw();
	if (raw.empty())
		return {};

	if (raw.front() == '\0')
		return std::string{"@"} + std::string{raw.substr(1)};

	/* strip the null terminator and anything after it */
	return std::string{raw.substr(0, raw.find('\0'))};
}

LocalSocketAddress
LocalSocketAddress::GetLocal(SocketDescriptor s)
{
	LocalSocketAddress result;
	socklen_t result_size = sizeof(result.address);
	if (getsockname(s.Get(), (struct sockaddr *)&result.address,
			&result_size) < 0)
		throw MakeSocketError("getsockname() failed");

	result.size = result_size;
	return result;
}
