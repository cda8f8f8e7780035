// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"
#include "system/Error.hxx"

#include <array>
#include <cassert>
#include <cerrno>
#include <span>

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() noexcept
{
	assert(idle_sockets.empty());
	assert(ready_sockets.empty());
}

bool
EventLoop::AddFD(int fd, unsigned events, SocketEvent &event) noexcept
{
	assert(events != 0);

	if (!epoll.Add(fd, events, &event))
		return false;

	idle_sockets.push_back(event);
	return true;
}

bool
EventLoop::ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept
{
	assert(events != 0);

	return epoll.Modify(fd, events, &event);
}

bool
EventLoop::RemoveFD(int fd, SocketEvent &event) noexcept
{
	event.unlink();
	return epoll.Remove(fd);
}

void
EventLoop::AbandonFD(SocketEvent &event) noexcept
{
	event.unlink();
}

void
EventLoop::Insert(TimerEvent &t) noexcept
{
	timers.insert(t);
}

Event::Duration
EventLoop::RunExpiredTimers() noexcept
{
	/* a callback may schedule another timer which is already
	   due; it is picked up by the next iteration */
	const auto now = SteadyNow();

	while (!quit && !timers.empty()) {
		auto &t = *timers.begin();
		if (t.due > now)
			return t.due - now;

		t.unlink();
		t.Run();
	}

	return Event::NO_TIMEOUT;
}

/**
 * Convert a timeout to the milliseconds parameter of epoll_wait(),
 * rounding up so the timer is due when epoll_wait() returns.
 */
static constexpr int
ToEpollTimeout(Event::Duration timeout) noexcept
{
	if (timeout < Event::Duration::zero())
		return -1;

	return std::chrono::ceil<std::chrono::milliseconds>(timeout).count();
}

void
EventLoop::Wait(Event::Duration timeout)
{
	std::array<struct epoll_event, 64> events;
	const int n = epoll.Wait(events.data(), events.size(),
				 ToEpollTimeout(timeout));
	if (n < 0) {
		if (errno == EINTR)
			return;

		throw MakeErrno("epoll_wait() failed");
	}

	for (const auto &e : std::span{events}.first(std::size_t(n))) {
		auto &socket = *static_cast<SocketEvent *>(e.data.ptr);
		socket.ready_flags = e.events;

		socket.unlink();
		ready_sockets.push_back(socket);
	}
}

void
EventLoop::DispatchReadySockets() noexcept
{
	while (!quit && !ready_sockets.empty()) {
		auto &socket = ready_sockets.front();

		/* back to the idle list before the callback, which
		   may cancel or destroy the #SocketEvent */
		socket.unlink();
		idle_sockets.push_back(socket);

		socket.Dispatch();
	}
}

void
EventLoop::Run()
{
	quit = false;
	FlushClockCaches();

	while (true) {
		const auto timeout = RunExpiredTimers();
		if (quit || IsEmpty())
			break;

		if (ready_sockets.empty()) {
			Wait(timeout);
			FlushClockCaches();
		}

		DispatchReadySockets();
		if (quit)
			break;
	}

	/* timers scheduled between Run() calls must not be based on
	   this iteration's time */
	FlushClockCaches();
}
