// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

#include <assert.h>

static constexpr char32_t MAX_CODEPOINT = 0x10ffff;
static constexpr char32_t REPLACEMENT_CHARACTER = 0xfffd;

constexpr bool
IsHighSurrogate(char32_t ch) noexcept
{
	return ch >= 0xd800 && ch <= 0xdbff;
}

constexpr bool
IsLowSurrogate(char32_t ch) noexcept
{
	return ch >= 0xdc00 && ch <= 0xdfff;
}

constexpr bool
IsSurrogate(char32_t ch) noexcept
{
	return ch >= 0xd800 && ch <= 0xdfff;
}

/**
 * Is this a value which can be encoded in UTF-16, i.e. a Unicode
 * scalar value?
 */
constexpr bool
IsScalarValue(char32_t ch) noexcept
{
	return ch <= MAX_CODEPOINT && !IsSurrogate(ch);
}

/**
 * Combine a surrogate pair into one codepoint.  The caller is
 * responsible for checking both halves.
 */
constexpr char32_t
CombineSurrogates(char16_t high, char16_t low) noexcept
{
	return 0x10000 + ((char32_t(high) - 0xd800) << 10) +
		(char32_t(low) - 0xdc00);
}

/**
 * How many UTF-16 code units does this codepoint need?
 */
constexpr std::size_t
CodepointLength(char32_t ch) noexcept
{
	return ch >= 0x10000 ? 2 : 1;
}

/**
 * Append a codepoint to a UTF-16 string, splitting it into a
 * surrogate pair if necessary.  Lone surrogate values are appended
 * as-is.
 */
inline void
AppendCodepoint(std::u16string &dest, char32_t ch)
{
	if (ch < 0x10000) {
		dest.push_back(char16_t(ch));
	} else {
		ch -= 0x10000;
		dest.push_back(char16_t(0xd800 + (ch >> 10)));
		dest.push_back(char16_t(0xdc00 + (ch & 0x3ff)));
	}
}

struct ScannedCodepoint {
	char32_t codepoint;

	/**
	 * The number of UTF-16 code units occupied by this codepoint
	 * (1 or 2).
	 */
	std::size_t units;
};

/**
 * Read the codepoint starting at the given position.  A high
 * surrogate immediately followed by a low surrogate is combined; any
 * other surrogate is returned as a degenerate single-unit codepoint.
 */
[[gnu::pure]]
constexpr ScannedCodepoint
ReadCodepoint(std::u16string_view s, std::size_t i) noexcept
{
	assert(i < s.size());

	const char16_t ch = s[i];
	if (IsHighSurrogate(ch) && i + 1 < s.size() &&
	    IsLowSurrogate(s[i + 1]))
		return {CombineSurrogates(ch, s[i + 1]), 2};

	return {ch, 1};
}
