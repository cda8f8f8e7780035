// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Chrono.hxx"
#include "SocketEvent.hxx"
#include "TimerEvent.hxx"
#include "system/EpollFD.hxx"
#include "time/ClockCache.hxx"

#include <boost/intrusive/list.hpp>
#include <boost/intrusive/set.hpp>

/**
 * A single-threaded event loop which waits for socket readiness
 * (epoll) and for timers.  All #SocketEvent and #TimerEvent
 * instances register themselves here; Run() returns as soon as
 * none is left or Break() has been called.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs it.
 */
class EventLoop final
{
	EpollFD epoll;

	using TimerSet =
		boost::intrusive::multiset<TimerEvent,
					   boost::intrusive::base_hook<boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
					   boost::intrusive::compare<TimerEvent::Compare>,
					   boost::intrusive::constant_time_size<false>>;

	/**
	 * Pending timers, the earliest first.
	 */
	TimerSet timers;

	using SocketList =
		boost::intrusive::list<SocketEvent,
				       boost::intrusive::base_hook<boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>>,
				       boost::intrusive::constant_time_size<false>>;

	/**
	 * Registered sockets which are not ready.
	 */
	SocketList idle_sockets;

	/**
	 * Sockets which were reported by epoll_wait() and whose
	 * callback has not been invoked yet.
	 */
	SocketList ready_sockets;

	ClockCache<Event::Clock> steady_clock_cache;

	bool quit = false;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	/**
	 * Caching wrapper for Event::Clock::now().  Inside Run(), the
	 * real clock is queried at most once per iteration; outside,
	 * on the first call after Run() has returned.
	 */
	[[gnu::pure]]
	const Event::TimePoint &SteadyNow() const noexcept {
		return steady_clock_cache.now();
	}

	void FlushClockCaches() noexcept {
		steady_clock_cache.flush();
	}

	/**
	 * Let Run() return at the next chance.
	 */
	void Break() noexcept {
		quit = true;
	}

	bool IsEmpty() const noexcept {
		return timers.empty() &&
			idle_sockets.empty() && ready_sockets.empty();
	}

	/**
	 * Throws std::system_error on error.
	 */
	void Run();

private:
	friend class SocketEvent;
	friend class TimerEvent;

	bool AddFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool ModifyFD(int fd, unsigned events, SocketEvent &event) noexcept;
	bool RemoveFD(int fd, SocketEvent &event) noexcept;

	/**
	 * Forget the #SocketEvent without EPOLL_CTL_DEL, because the
	 * kernel has already done that.
	 */
	void AbandonFD(SocketEvent &event) noexcept;

	void Insert(TimerEvent &t) noexcept;

	/**
	 * Invoke all timers which are due.
	 *
	 * @return the duration until the next timer is due, or
	 * Event::NO_TIMEOUT if there is none
	 */
	Event::Duration RunExpiredTimers() noexcept;

	/**
	 * Wait for socket readiness and move all reported sockets to
	 * #ready_sockets.
	 */
	void Wait(Event::Duration timeout);

	void DispatchReadySockets() noexcept;
};
