// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Chrono.hxx"
#include "util/BindMethod.hxx"

#include <boost/intrusive/set_hook.hpp>

class EventLoop;

/**
 * Invoke an event callback after a certain amount of time.
 *
 * This class is not thread-safe, all methods must be called from the
 * thread that runs the #EventLoop.
 */
class TimerEvent final
	: public boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

	/**
	 * When is this timer due?  This is only valid if IsPending()
	 * returns true.
	 */
	Event::TimePoint due;

public:
	/**
	 * Orders #TimerEvent instances by their due time.
	 */
	struct Compare {
		constexpr bool operator()(const TimerEvent &a,
					  const TimerEvent &b) const noexcept {
			return a.due < b.due;
		}
	};

	TimerEvent(EventLoop &_loop, Callback _callback) noexcept
		:loop(_loop), callback(_callback) {}

	TimerEvent(const TimerEvent &) = delete;
	TimerEvent &operator=(const TimerEvent &) = delete;

	auto &GetEventLoop() const noexcept {
		return loop;
	}

	constexpr auto GetDue() const noexcept {
		return due;
	}

	bool IsPending() const noexcept {
		return is_linked();
	}

	/**
	 * Schedule the timer to expire after the given duration,
	 * measured from the #EventLoop's cached "now".  Reschedules
	 * the timer if it is already pending.
	 */
	void Schedule(Event::Duration d) noexcept;

	/**
	 * Schedule the timer to expire at the given absolute time
	 * point.
	 */
	void ScheduleAt(Event::TimePoint _due) noexcept;

	/**
	 * Like Schedule(), but is a no-op if there is a due time
	 * earlier than the given one.
	 */
	void ScheduleEarlier(Event::Duration d) noexcept;

	void Cancel() noexcept {
		if (IsPending())
			unlink();
	}

private:
	void Run() noexcept {
		callback();
	}
};
