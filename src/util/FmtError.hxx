// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <stdexcept>

template<typename... Args>
std::runtime_error
FmtRuntimeError(fmt::string_view format_str, Args&&... args)
{
	return std::runtime_error(fmt::vformat(format_str,
					       fmt::make_format_args(args...)));
}

template<typename... Args>
std::invalid_argument
FmtInvalidArgument(fmt::string_view format_str, Args&&... args)
{
	return std::invalid_argument(fmt::vformat(format_str,
						  fmt::make_format_args(args...)));
}
