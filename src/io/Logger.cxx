// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

std::string_view
LoggerDetail::ToLogString(std::exception_ptr ep, std::string &storage) noexcept
{
	storage = GetFullMessage(std::move(ep));
	return storage;
}

std::string_view
LoggerDetail::ToLogString(int value, std::string &storage) noexcept
{
	storage = fmt::format_int{value}.str();
	return storage;
}

std::string_view
LoggerDetail::ToLogString(unsigned value, std::string &storage) noexcept
{
	storage = fmt::format_int{value}.str();
	return storage;
}

static constexpr struct iovec
ToIovec(std::string_view s) noexcept
{
	return {const_cast<char *>(s.data()), s.size()};
}

void
LoggerDetail::WriteV(std::string_view domain,
		     std::span<const std::string_view> buffers) noexcept
{
	/* room for the domain prefix, the newline and the
	   parameters; excess parameters are dropped */
	std::array<struct iovec, 32> v;
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = ToIovec("[");
		v[n++] = ToIovec(domain);
		v[n++] = ToIovec("] ");
	}

	for (const std::string_view i : buffers) {
		if (n == v.size() - 1)
			break;

		v[n++] = ToIovec(i);
	}

	v[n++] = ToIovec("\n");

	/* nothing sensible can be done if writing to stderr
	   fails */
	[[maybe_unused]] const auto nbytes = writev(STDERR_FILENO, v.data(), n);
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);

	const std::string_view line{buffer.data(), buffer.size()};
	WriteV(domain, std::span{&line, 1});
}
