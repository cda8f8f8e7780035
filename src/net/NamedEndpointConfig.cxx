// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "NamedEndpointConfig.hxx"

#include <stdexcept>

void
NamedEndpointConfig::Check() const
{
	if (address.IsNull())
		throw std::invalid_argument{"No socket address configured"};
}
