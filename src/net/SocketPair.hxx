// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueSocketDescriptor.hxx"

#include <utility>

/**
 * Create a connected pair of non-blocking local sockets (both with
 * close-on-exec), e.g. for handing one end to a
 * #NamedEndpointSocket.
 *
 * Throws on error.
 *
 * @param type the socket type, e.g. SOCK_STREAM
 */
std::pair<UniqueSocketDescriptor, UniqueSocketDescriptor>
CreateSocketPairNonBlock(int type);
