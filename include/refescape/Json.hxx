// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of JSON string contents.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace RefEscape {

class EscapeSink;

enum class JsonEscapeType : uint_least8_t {
	/**
	 * Use "\n", "\"" etc. where possible, "\uHHHH" for everything
	 * else.
	 */
	SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA,

	UHEXA,
};

enum class JsonEscapeLevel : uint_least8_t {
	/**
	 * Escape the characters which have a single escape character,
	 * all control characters and "/" after "<".
	 */
	LEVEL_1_BASIC_ESCAPE_SET = 1,

	LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,

	LEVEL_3_ALL_NON_ALPHANUMERIC,

	LEVEL_4_ALL_CHARACTERS,
};

/**
 * Throws std::invalid_argument if #type or #level is not a valid
 * enum value.
 *
 * @return #text if nothing needed to be escaped (this includes a
 * null view), or a view on #buffer
 *
 * #text may itself be a view on #buffer (i.e. the result of a
 * previous call).
 */
std::u16string_view
JsonEscape(std::u16string_view text, std::u16string &buffer,
	   JsonEscapeType type=JsonEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA,
	   JsonEscapeLevel level=JsonEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET);

void
JsonEscape(std::span<const char16_t> src,
	   std::size_t offset, std::size_t length,
	   EscapeSink &sink,
	   JsonEscapeType type, JsonEscapeLevel level);

std::u16string_view
JsonUnescape(std::u16string_view text, std::u16string &buffer);

void
JsonUnescape(std::span<const char16_t> src,
	     std::size_t offset, std::size_t length,
	     EscapeSink &sink);

} // namespace RefEscape
