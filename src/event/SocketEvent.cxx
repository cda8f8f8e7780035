// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SocketEvent.hxx"
#include "Loop.hxx"

#include <cassert>
#include <cerrno>
#include <utility>

void
SocketEvent::Open(SocketDescriptor _fd) noexcept
{
	assert(_fd.IsDefined());
	assert(!fd.IsDefined());
	assert(scheduled_flags == 0);

	fd = _fd;
}

void
SocketEvent::Close() noexcept
{
	if (!fd.IsDefined())
		return;

	/* epoll forgets a registration only when the last duplicate
	   of the descriptor is closed, so unregister explicitly */
	Cancel();

	fd.Close();
}

bool
SocketEvent::Schedule(unsigned flags) noexcept
{
	if (flags != 0)
		flags |= IMPLICIT_FLAGS;

	if (flags == scheduled_flags)
		return true;

	assert(fd.IsDefined());

	bool success;
	if (flags == 0)
		success = loop.RemoveFD(fd.Get(), *this);
	else if (scheduled_flags == 0)
		success = loop.AddFD(fd.Get(), flags, *this);
	else
		success = loop.ModifyFD(fd.Get(), flags, *this);

	if (success) {
		scheduled_flags = flags;
	} else if (errno == EBADF || errno == ENOENT) {
		/* the descriptor is no longer registered with epoll
		   (it was closed, or its number was reused) */
		loop.AbandonFD(*this);
		scheduled_flags = 0;
	}

	return success;
}

void
SocketEvent::Dispatch() noexcept
{
	const unsigned flags = std::exchange(ready_flags, 0) &
		scheduled_flags;

	if (flags != 0)
		callback(flags);
}
