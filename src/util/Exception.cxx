// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

#include <stdexcept>

#include <stdio.h>

static void
AppendMessage(std::string &result, const std::exception &e) noexcept
try {
	if (!result.empty())
		result += ": ";
	result += e.what();

	std::rethrow_if_nested(e);
} catch (const std::exception &nested) {
	AppendMessage(result, nested);
} catch (...) {
	result += ": Unrecognized nested exception";
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
try {
	std::rethrow_exception(ep);
} catch (const std::exception &e) {
	std::string result;
	AppendMessage(result, e);
	return result;
} catch (...) {
	return "Unrecognized exception";
}

void
PrintException(std::exception_ptr ep) noexcept
{
	fprintf(stderr, "%s\n", GetFullMessage(ep).c_str());
}
