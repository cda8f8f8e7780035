// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SocketDescriptor.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <utility>

/**
 * Wrapper for a socket file descriptor.  The socket is closed by
 * the destructor unless it has been handed to a new owner with
 * Release().
 */
class UniqueSocketDescriptor : public SocketDescriptor {
public:
	UniqueSocketDescriptor() noexcept
		:SocketDescriptor(SocketDescriptor::Undefined()) {}

	explicit UniqueSocketDescriptor(AdoptTag, int _fd) noexcept
		:SocketDescriptor(_fd) {}

	explicit UniqueSocketDescriptor(SocketDescriptor _fd) noexcept
		:SocketDescriptor(_fd) {}

	/**
	 * Adopt a descriptor which is known to refer to a socket,
	 * e.g. one received over a local socket.
	 */
	explicit UniqueSocketDescriptor(UniqueFileDescriptor &&_fd) noexcept
		:SocketDescriptor(_fd.Release()) {}

	UniqueSocketDescriptor(UniqueSocketDescriptor &&src) noexcept
		:SocketDescriptor(src.Release()) {}

	~UniqueSocketDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueSocketDescriptor &operator=(UniqueSocketDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool operator==(const UniqueSocketDescriptor &other) const noexcept {
		return fd == other.fd;
	}

	/**
	 * Release ownership and return the descriptor as an unmanaged
	 * #SocketDescriptor instance.
	 */
	SocketDescriptor Release() noexcept {
		return std::exchange(*(SocketDescriptor *)this, Undefined());
	}

	/**
	 * @return an "undefined" instance on error (errno set)
	 */
	UniqueSocketDescriptor AcceptNonBlock() const noexcept {
		return UniqueSocketDescriptor(SocketDescriptor::AcceptNonBlock());
	}
};
