// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
		return e.what();
	} catch (const std::exception &nested) {
		return std::string{e.what()} + separator +
			GetFullMessage(nested, fallback, separator);
	} catch (...) {
		return std::string{e.what()} + separator + fallback;
	}
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	if (!ep)
		return fallback;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
