// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/*
 * ASCII character classification on UTF-16 code units.  Anything
 * outside the ASCII range is never matched.
 */

constexpr bool
IsDigitASCII(char16_t ch) noexcept
{
	return ch >= u'0' && ch <= u'9';
}

constexpr bool
IsOctalDigitASCII(char16_t ch) noexcept
{
	return ch >= u'0' && ch <= u'7';
}

constexpr bool
IsUpperAlphaASCII(char16_t ch) noexcept
{
	return ch >= u'A' && ch <= u'Z';
}

constexpr bool
IsLowerAlphaASCII(char16_t ch) noexcept
{
	return ch >= u'a' && ch <= u'z';
}

constexpr bool
IsAlphaASCII(char16_t ch) noexcept
{
	return IsUpperAlphaASCII(ch) || IsLowerAlphaASCII(ch);
}

constexpr bool
IsAlphaNumericASCII(char16_t ch) noexcept
{
	return IsAlphaASCII(ch) || IsDigitASCII(ch);
}

/**
 * Returns the value of a hexadecimal digit (either case) or -1.
 */
constexpr int
ParseHexDigit(char16_t ch) noexcept
{
	if (IsDigitASCII(ch))
		return ch - u'0';
	else if (ch >= u'a' && ch <= u'f')
		return ch - u'a' + 0xa;
	else if (ch >= u'A' && ch <= u'F')
		return ch - u'A' + 0xa;
	else
		return -1;
}

constexpr bool
IsHexDigitASCII(char16_t ch) noexcept
{
	return ParseHexDigit(ch) >= 0;
}
