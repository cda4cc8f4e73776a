// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "refescape/Sink.hxx"

#include <functional>
#include <string>
#include <string_view>

/**
 * Does the given view point into the buffer's contents?
 */
[[gnu::pure]]
inline bool
PointsInto(std::u16string_view text, const std::u16string &buffer) noexcept
{
	if (buffer.empty() || text.data() == nullptr)
		return false;

	const char16_t *begin = buffer.data(), *end = begin + buffer.size();
	return std::greater_equal<const char16_t *>{}(text.data(), begin) &&
		std::less<const char16_t *>{}(text.data(), end);
}

/**
 * Run a sink-based escape/unescape function and collect its output
 * in the given buffer.  Returns the buffer contents if the function
 * returned true, or the original text if it did not modify anything.
 *
 * The text may be a view on the buffer (e.g. the result of a
 * previous call with the same buffer); in that case, the output is
 * collected in a temporary string which replaces the buffer only
 * after the input has been consumed completely.
 *
 * @param f a function taking a #RefEscape::EscapeSink reference and
 * returning bool
 */
template<typename F>
std::u16string_view
WriteToBuffer(std::u16string_view text, std::u16string &buffer,
	      std::size_t reserve, F &&f)
{
	if (text.data() == nullptr)
		return text;

	if (PointsInto(text, buffer)) {
		std::u16string tmp;
		tmp.reserve(reserve);

		RefEscape::StringEscapeSink sink(tmp);
		if (!f(sink))
			return text;

		buffer.swap(tmp);
		return buffer;
	}

	buffer.clear();
	buffer.reserve(reserve);

	RefEscape::StringEscapeSink sink(buffer);
	if (!f(sink))
		return text;

	return buffer;
}
