// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/FileDescriptor.hxx"

#include <cstddef>
#include <span>
#include <type_traits>

#include <sys/socket.h>

struct msghdr;
class SocketAddress;

/**
 * An OO wrapper for a UNIX socket descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueSocketDescriptor.
 */
class SocketDescriptor : protected FileDescriptor {
protected:
	explicit constexpr SocketDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	constexpr bool operator==(SocketDescriptor other) const noexcept {
		return fd == other.fd;
	}

	/**
	 * Convert a #FileDescriptor to a #SocketDescriptor.  This is
	 * only valid if the file descriptor really refers to a socket.
	 */
	static constexpr SocketDescriptor FromFileDescriptor(FileDescriptor _fd) noexcept {
		return SocketDescriptor(_fd);
	}

	constexpr const FileDescriptor &ToFileDescriptor() const noexcept {
		return *this;
	}

	using FileDescriptor::IsDefined;
	using FileDescriptor::Get;
	using FileDescriptor::SetNonBlocking;
	using FileDescriptor::EnableCloseOnExec;
	using FileDescriptor::Close;

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor(FileDescriptor::Undefined());
	}

	/**
	 * @return True on success, False on failure
	 * See man 2 socket for detailed information
	 */
	bool Create(int domain, int type, int protocol) noexcept;

	/**
	 * Like Create(), but enable non-blocking mode.
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	int GetError() const noexcept;

	/**
	 * @return the value size or 0 on error
	 */
	std::size_t GetOption(int level, int name,
			      void *value, std::size_t size) const noexcept;

	bool SetOption(int level, int name,
		       const void *value, std::size_t size) const noexcept;

	bool SetIntOption(int level, int name, const int &value) const noexcept {
		return SetOption(level, name, &value, sizeof(value));
	}

	bool SetSendBuffer(unsigned size) const noexcept;

	bool Bind(SocketAddress address) const noexcept;

	bool Listen(int backlog) const noexcept;

	/**
	 * Accept a new connection with the close-on-exec and
	 * non-blocking flags set.
	 *
	 * @return the new socket or SocketDescriptor::Undefined() on
	 * error (errno set)
	 */
	SocketDescriptor AcceptNonBlock() const noexcept;

	bool Connect(SocketAddress address) const noexcept;

	ssize_t Receive(std::span<std::byte> dest, int flags=0) const noexcept;
	ssize_t Send(std::span<const std::byte> src, int flags=0) const noexcept;

	/**
	 * Wrapper for recvmsg().
	 */
	ssize_t Receive(struct msghdr &msg, int flags=0) const noexcept;

	/**
	 * Wrapper for sendmsg().
	 */
	ssize_t Send(const struct msghdr &msg, int flags=0) const noexcept;
};

static_assert(std::is_trivial_v<SocketDescriptor>);
