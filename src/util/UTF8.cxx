// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UTF8.hxx"
#include "UTF16.hxx"

#include <utility>

char *
UnicodeToUTF8(char32_t ch, char *q) noexcept
{
	if (ch < 0x80) {
		*q++ = char(ch);
	} else if (ch < 0x800) {
		*q++ = char(0xc0 | (ch >> 6));
		*q++ = char(0x80 | (ch & 0x3f));
	} else if (ch < 0x10000) {
		*q++ = char(0xe0 | (ch >> 12));
		*q++ = char(0x80 | ((ch >> 6) & 0x3f));
		*q++ = char(0x80 | (ch & 0x3f));
	} else {
		*q++ = char(0xf0 | (ch >> 18));
		*q++ = char(0x80 | ((ch >> 12) & 0x3f));
		*q++ = char(0x80 | ((ch >> 6) & 0x3f));
		*q++ = char(0x80 | (ch & 0x3f));
	}

	return q;
}

static constexpr bool
IsContinuation(unsigned char ch) noexcept
{
	return (ch & 0xc0) == 0x80;
}

/**
 * Decode one UTF-8 sequence.  Returns the codepoint and the number
 * of bytes consumed; malformed input yields U+FFFD for one byte.
 */
static std::pair<char32_t, std::size_t>
DecodeUTF8(std::string_view s) noexcept
{
	const auto *p = reinterpret_cast<const unsigned char *>(s.data());
	const unsigned char ch = p[0];

	if (ch < 0x80)
		return {ch, 1};

	std::size_t n;
	char32_t value, min;
	if ((ch & 0xe0) == 0xc0) {
		n = 2;
		value = ch & 0x1f;
		min = 0x80;
	} else if ((ch & 0xf0) == 0xe0) {
		n = 3;
		value = ch & 0x0f;
		min = 0x800;
	} else if ((ch & 0xf8) == 0xf0) {
		n = 4;
		value = ch & 0x07;
		min = 0x10000;
	} else
		return {REPLACEMENT_CHARACTER, 1};

	if (s.size() < n)
		return {REPLACEMENT_CHARACTER, 1};

	for (std::size_t i = 1; i < n; ++i) {
		if (!IsContinuation(p[i]))
			return {REPLACEMENT_CHARACTER, 1};

		value = (value << 6) | (p[i] & 0x3f);
	}

	if (value < min || !IsScalarValue(value))
		return {REPLACEMENT_CHARACTER, n};

	return {value, n};
}

std::u16string
UTF8ToUTF16(std::string_view src)
{
	std::u16string dest;
	dest.reserve(src.size());

	while (!src.empty()) {
		const auto [ch, n] = DecodeUTF8(src);
		AppendCodepoint(dest, ch);
		src.remove_prefix(n);
	}

	return dest;
}

std::string
UTF16ToUTF8(std::u16string_view src)
{
	std::string dest;
	dest.reserve(src.size());

	for (std::size_t i = 0; i < src.size();) {
		auto [ch, units] = ReadCodepoint(src, i);
		if (IsSurrogate(ch))
			ch = REPLACEMENT_CHARACTER;

		char buffer[4];
		dest.append(buffer, UnicodeToUTF8(ch, buffer));
		i += units;
	}

	return dest;
}
