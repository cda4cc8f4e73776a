// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>

/**
 * Set the global verbosity: messages with a level greater than this
 * are suppressed.  The default is 1 (errors only).
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
IsLogLevelVisible(unsigned level) noexcept;

void
LogRaw(unsigned level, std::string_view domain, std::string_view msg) noexcept;

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::string_view format_str, Args&&... args) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	LogVFmt(level, domain, format_str, fmt::make_format_args(args...));
}

/**
 * Base class for objects which log messages with a common prefix.
 * The prefix is generated lazily by MakeLogName().
 */
class Logger {
	mutable std::string log_name;

public:
	const std::string &GetLogName() const noexcept {
		if (log_name.empty())
			log_name = MakeLogName();
		return log_name;
	}

	void ResetLogName() noexcept {
		log_name.clear();
	}

	void Log(unsigned level, std::string_view msg) const noexcept {
		LogRaw(level, GetLogName(), msg);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::string_view format_str,
		 Args&&... args) const noexcept {
		if (!IsLogLevelVisible(level))
			return;

		LogVFmt(level, GetLogName(), format_str,
			fmt::make_format_args(args...));
	}

	void Log(unsigned level, std::string_view prefix,
		 std::exception_ptr ep) const noexcept;

protected:
	virtual std::string MakeLogName() const noexcept = 0;
};
