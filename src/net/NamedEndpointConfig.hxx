// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LocalSocketAddress.hxx"
#include "event/Chrono.hxx"

/**
 * Settings for a #NamedEndpointSocket.
 */
struct NamedEndpointConfig {
	LocalSocketAddress address;

	/**
	 * If non-zero, calls listen() after binding.  Value is the
	 * backlog.
	 */
	unsigned listen = 0;

	/**
	 * Delete a stale socket file before binding?  This has no
	 * effect on abstract sockets.
	 */
	bool unlink_stale = true;

	Event::Duration connect_timeout = std::chrono::seconds{10};

	/**
	 * Timeout for sending and receiving descriptors.
	 */
	Event::Duration io_timeout = Event::NO_TIMEOUT;

	/**
	 * Throws std::invalid_argument if the configuration is not
	 * usable.
	 */
	void Check() const;
};
