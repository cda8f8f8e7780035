// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SocketAddress.hxx"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <stddef.h> // for offsetof()
#include <sys/un.h>

class SocketDescriptor;

#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__NetBSD__) || \
	defined(__OpenBSD__) || defined(__DragonFly__)
/* BSD-derived kernels have a one-byte "sun_len" field in front of
   the address family */
#define HAVE_SUN_LEN
#endif

/**
 * The address of a local (AF_LOCAL / AF_UNIX) socket, stored in a
 * struct sockaddr_un.  The encoded form is:
 *
 * - (BSD only) one byte with the total length of the address
 * - the address family #AF_LOCAL
 * - the path bytes
 * - one null byte (not present for abstract sockets)
 *
 * Paths which start with '@' refer to an abstract socket (Linux
 * only); the '@' is encoded as a null byte.
 *
 * All knowledge about the layout of struct sockaddr_un is in this
 * class.
 */
class LocalSocketAddress {
	struct sockaddr_un address;

	/**
	 * The number of bytes of #address which are used.  Zero means
	 * this object is "null".
	 */
	SocketAddress::size_type size = 0;

public:
	/**
	 * The number of bytes in front of the path.
	 */
	static constexpr std::size_t HEADER_SIZE = offsetof(struct sockaddr_un, sun_path);

	/**
	 * The maximum length of a path (excluding the null
	 * terminator).
	 */
	static constexpr std::size_t MAX_PATH_LENGTH = sizeof(sockaddr_un::sun_path) - 1;

	/**
	 * Construct a "null" instance.
	 */
	LocalSocketAddress() noexcept = default;

	/**
	 * Throws std::length_error if the path is too long for
	 * struct sockaddr_un and std::invalid_argument if the path
	 * is malformed.
	 */
	explicit LocalSocketAddress(std::string_view path) {
		SetLocal(path);
	}

	/**
	 * Copy (and validate) a generic #SocketAddress.
	 *
	 * Throws std::invalid_argument if it is not a local socket
	 * address.
	 */
	explicit LocalSocketAddress(SocketAddress src);

	constexpr bool IsNull() const noexcept {
		return size == 0;
	}

	/**
	 * Encode the given path.  On error, this object is left
	 * unmodified.
	 *
	 * Throws std::length_error if the path is too long for
	 * struct sockaddr_un and std::invalid_argument if the path
	 * is malformed.
	 */
	void SetLocal(std::string_view path);

	/**
	 * Calculate the encoded size of the given path without
	 * checking it.
	 */
	static constexpr std::size_t GetEncodedSize(std::string_view path) noexcept {
		return HEADER_SIZE + path.size() +
			/* the null terminator; for abstract sockets,
			   the leading '@' becomes a null byte instead */
			(path.starts_with('@') ? 0 : 1);
	}

	constexpr SocketAddress::size_type GetSize() const noexcept {
		return size;
	}

	int GetFamily() const noexcept {
		return address.sun_family;
	}

	bool IsAbstract() const noexcept {
		return size > HEADER_SIZE && address.sun_path[0] == '\0';
	}

	operator SocketAddress() const noexcept {
		return {(const struct sockaddr *)&address, size};
	}

	/**
	 * The raw encoded bytes as passed to bind() and connect().
	 */
	std::span<const std::byte> GetBytes() const noexcept {
		return {(const std::byte *)&address, size};
	}

	/**
	 * @see SocketAddress::GetLocalRaw()
	 */
	[[gnu::pure]]
	std::string_view GetLocalRaw() const noexcept {
		return SocketAddress{*this}.GetLocalRaw();
	}

	/**
	 * @see SocketAddress::GetLocalPath()
	 */
	[[gnu::pure]]
	const char *GetLocalPath() const noexcept {
		return SocketAddress{*this}.GetLocalPath();
	}

	/**
	 * Decode the path, the inverse of SetLocal().  Abstract names
	 * are returned with a '@' prefix.
	 */
	std::string GetPath() const;

	/**
	 * Obtain the bound address of the given socket with
	 * getsockname().
	 *
	 * Throws on error.
	 */
	static LocalSocketAddress GetLocal(SocketDescriptor s);

private:
	void SetFamily() noexcept;
};
