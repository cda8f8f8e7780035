// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string_view>

#include <sys/socket.h>

struct sockaddr;

/**
 * An OO wrapper for struct sockaddr.  It does not own the pointed-to
 * buffer.
 */
class SocketAddress {
public:
	typedef socklen_t size_type;

private:
	const struct sockaddr *address = nullptr;
	size_type size = 0;

public:
	SocketAddress() = default;

	constexpr SocketAddress(std::nullptr_t) noexcept {}

	constexpr SocketAddress(const struct sockaddr *_address,
				size_type _size) noexcept
		:address(_address), size(_size) {}

	constexpr bool IsNull() const noexcept {
		return address == nullptr;
	}

	constexpr const struct sockaddr *GetAddress() const noexcept {
		return address;
	}

	constexpr size_type GetSize() const noexcept {
		return size;
	}

	constexpr int GetFamily() const noexcept {
		return address->sa_family;
	}

	/**
	 * Does the object have a well-defined address?  Check !IsNull()
	 * before calling this method.
	 */
	constexpr bool IsDefined() const noexcept {
		return GetFamily() != AF_UNSPEC;
	}

	/**
	 * Extract the raw bytes of the local socket path (or the
	 * abstract name, including its leading null byte).  Returns
	 * an empty string if this is not a local socket or if it is
	 * unnamed.
	 */
	[[gnu::pure]]
	std::string_view GetLocalRaw() const noexcept;

	/**
	 * Returns the local socket path or nullptr if this is not a
	 * local socket, or if it is an abstract or unnamed socket.
	 */
	[[gnu::pure]]
	const char *GetLocalPath() const noexcept;

	[[gnu::pure]]
	bool operator==(SocketAddress other) const noexcept;
};
