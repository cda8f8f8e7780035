// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileDescriptor.hxx"

#include <fcntl.h>

#ifndef O_CLOEXEC
#define O_CLOEXEC 0
#endif

bool
FileDescriptor::Open(const char *pathname, int flags, mode_t mode) noexcept
{
	fd = ::open(pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	return Open(pathname, O_RDONLY);
}

void
FileDescriptor::SetNonBlocking() const noexcept
{
	int flags = fcntl(fd, F_GETFL);
	fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void
FileDescriptor::EnableCloseOnExec() const noexcept
{
	const int old_flags = fcntl(fd, F_GETFD, 0);
	fcntl(fd, F_SETFD, old_flags | FD_CLOEXEC);
}

FileDescriptor
FileDescriptor::DuplicateCloseOnExec() const noexcept
{
	return FileDescriptor(fcntl(fd, F_DUPFD_CLOEXEC, 0));
}
