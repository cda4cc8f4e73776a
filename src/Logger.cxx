// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <atomic>
#include <iterator>

#include <stdio.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

bool
IsLogLevelVisible(unsigned level) noexcept
{
	return level <= log_level.load(std::memory_order_relaxed);
}

void
LogRaw(unsigned level, std::string_view domain, std::string_view msg) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	fprintf(stderr, "[%.*s] %.*s\n",
		int(domain.size()), domain.data(),
		int(msg.size()), msg.data());
}

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
try {
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	LogRaw(level, domain, {buffer.data(), buffer.size()});
} catch (...) {
	LogRaw(1, domain, "failed to format log message");
}

void
Logger::Log(unsigned level, std::string_view prefix,
	    std::exception_ptr ep) const noexcept
{
	LogFmt(level, GetLogName(), "{}: {}", prefix, GetFullMessage(ep));
}
