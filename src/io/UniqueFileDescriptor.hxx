// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * Tag type used by the #UniqueFileDescriptor and
 * #UniqueSocketDescriptor constructors which adopt a raw integer
 * descriptor.
 */
struct AdoptTag {};

/**
 * An OO wrapper for an owned UNIX file descriptor.  The descriptor
 * is closed exactly once: by the destructor, by Close() or not at
 * all after Release() has handed it to a new owner.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(AdoptTag, int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(const UniqueFileDescriptor &) = delete;

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			FileDescriptor::Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&other) noexcept {
		using std::swap;
		swap(fd, other.fd);
		return *this;
	}

	/**
	 * Convert this object to its #FileDescriptor base type.  This
	 * hides the fact that it is a #UniqueFileDescriptor instance
	 * for callers which do not care about ownership.
	 */
	constexpr const FileDescriptor &ToFileDescriptor() const noexcept {
		return *this;
	}

	/**
	 * Release ownership and return the descriptor as an unmanaged
	 * #FileDescriptor instance.
	 */
	FileDescriptor Release() noexcept {
		return std::exchange(*(FileDescriptor *)this, Undefined());
	}

	bool Close() noexcept {
		return IsDefined() && FileDescriptor::Close();
	}
};
