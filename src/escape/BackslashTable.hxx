// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cstdint>

/**
 * Describes a format which escapes characters with a backslash
 * (JSON, JavaScript and Java string literals, CSS).
 */
struct BackslashTable {
	/**
	 * Single escape characters are defined only for codepoints
	 * below this value.
	 */
	static constexpr char32_t SEC_LIMIT = 0x80;

	static constexpr char32_t LEVELS_LIMIT = 0xa0;

	/**
	 * The single escape character for each codepoint (e.g. 'n'
	 * for U+000A), or 0 if there is none.
	 */
	std::array<char16_t, SEC_LIMIT> secs{};

	/**
	 * Minimum escape level per codepoint; the last element applies
	 * to all codepoints from #LEVELS_LIMIT on.
	 */
	std::array<uint_least8_t, LEVELS_LIMIT + 1> levels{};

	/**
	 * Escape '/' below level 3 only if it follows '<', to avoid
	 * "</script>" inside inline scripts.
	 */
	bool slash_only_after_lt = false;

	/**
	 * Allow "\xHH" escapes.
	 */
	bool xhexa = false;

	/**
	 * Recognize octal escapes ("\0".."\377") when unescaping.
	 */
	bool octal = false;

	/**
	 * Allow "\uuuu0041" when unescaping.
	 */
	bool repeated_u = false;

	constexpr uint_least8_t GetLevel(char32_t codepoint) const noexcept {
		return levels[codepoint < LEVELS_LIMIT
			      ? codepoint
			      : LEVELS_LIMIT];
	}

	constexpr char16_t GetSec(char32_t codepoint) const noexcept {
		return codepoint < SEC_LIMIT ? secs[codepoint] : 0;
	}

	constexpr void SetSec(char32_t codepoint, char16_t sec) noexcept {
		secs[codepoint] = sec;
	}

	constexpr void SetLevel(char32_t codepoint, uint_least8_t level) noexcept {
		levels[codepoint] = level;
	}

	constexpr void SetLevelRange(char32_t first, char32_t last,
				     uint_least8_t level) noexcept {
		for (char32_t ch = first; ch <= last; ++ch)
			levels[ch] = level;
	}

	/**
	 * Set up the levels shared by all backslash formats: ASCII
	 * alphanumerics at 4, other ASCII at 3, non-ASCII at 2, all
	 * characters with a single escape character and all control
	 * characters at 1.
	 */
	constexpr void SetCommonLevels() noexcept {
		levels.fill(3);
		SetLevelRange('0', '9', 4);
		SetLevelRange('A', 'Z', 4);
		SetLevelRange('a', 'z', 4);
		SetLevelRange(0x80, 0x9f, 2);
		levels[LEVELS_LIMIT] = 2;

		for (char32_t ch = 0; ch < SEC_LIMIT; ++ch)
			if (secs[ch] != 0)
				levels[ch] = 1;

		SetLevelRange(0x00, 0x1f, 1);
		SetLevelRange(0x7f, 0x9f, 1);
	}
};

struct BackslashEscapeType {
	/**
	 * Use single escape characters where available.
	 */
	bool use_secs;

	/**
	 * Use "\xHH" for codepoints up to 0xff.
	 */
	bool use_xhexa;
};
