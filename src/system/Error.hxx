// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <system_error> // IWYU pragma: export
#include <utility>

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.
 */
static inline const std::error_category &
ErrnoCategory() noexcept
{
	/* on POSIX, the std::system_category() uses errno values */
	return std::system_category();
}

template<typename... Args>
static inline std::system_error
MakeErrno(int code, Args&&... args) noexcept
{
	return std::system_error(code, ErrnoCategory(),
				 std::forward<Args>(args)...);
}

template<typename... Args>
static inline std::system_error
MakeErrno(Args&&... args) noexcept
{
	return MakeErrno(errno, std::forward<Args>(args)...);
}

[[gnu::pure]]
inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}

[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}
