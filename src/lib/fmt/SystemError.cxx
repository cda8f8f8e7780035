// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SystemError.hxx"

#include <fmt/format.h>

std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	buffer.push_back('\0');

	return std::system_error{code, buffer.data()};
}

std::system_error
VFmtErrno(int code,
	  fmt::string_view format_str, fmt::format_args args) noexcept
{
	return VFmtSystemError(std::error_code(code, std::system_category()),
			       format_str, args);
}
