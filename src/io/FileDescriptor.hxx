// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool operator==(FileDescriptor other) const noexcept {
		return fd == other.fd;
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	constexpr void Set(int _fd) noexcept {
		fd = _fd;
	}

	constexpr int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept;

	bool OpenReadOnly(const char *pathname) noexcept;

	/**
	 * Set the O_NONBLOCK flag.
	 */
	void SetNonBlocking() const noexcept;

	void EnableCloseOnExec() const noexcept;

	/**
	 * Duplicate this file descriptor with the close-on-exec flag
	 * set.
	 *
	 * @return the new descriptor or FileDescriptor::Undefined()
	 * on error (errno set)
	 */
	FileDescriptor DuplicateCloseOnExec() const noexcept;

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false, and this object may be reused.
	 */
	bool Close() noexcept {
		return ::close(Steal()) == 0;
	}

	ssize_t Read(std::span<std::byte> dest) const noexcept {
		return ::read(fd, dest.data(), dest.size());
	}

	ssize_t Write(std::span<const std::byte> src) const noexcept {
		return ::write(fd, src.data(), src.size());
	}
};
