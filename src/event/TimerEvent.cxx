// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimerEvent.hxx"
#include "Loop.hxx"

void
TimerEvent::Schedule(Event::Duration d) noexcept
{
	ScheduleAt(loop.SteadyNow() + d);
}

void
TimerEvent::ScheduleAt(Event::TimePoint _due) noexcept
{
	Cancel();

	due = _due;
	loop.Insert(*this);
}

void
TimerEvent::ScheduleEarlier(Event::Duration d) noexcept
{
	const auto new_due = loop.SteadyNow() + d;

	if (IsPending() && new_due >= due)
		/* we already have an earlier due time */
		return;

	ScheduleAt(new_due);
}
