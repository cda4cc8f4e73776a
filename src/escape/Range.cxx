// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Range.hxx"
#include "util/FmtError.hxx"

std::u16string_view
CheckRange(std::span<const char16_t> buffer,
	   std::size_t offset, std::size_t length)
{
	if (offset > buffer.size() || length > buffer.size() - offset)
		throw FmtInvalidArgument("Invalid range offset={} length={} in buffer of size {}",
					 offset, length, buffer.size());

	return {buffer.data() + offset, length};
}
