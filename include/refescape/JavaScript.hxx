// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of JavaScript string literal contents.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace RefEscape {

class EscapeSink;

enum class JavaScriptEscapeType : uint_least8_t {
	/**
	 * Use "\n", "\'" etc. where possible, "\xHH" for codepoints up
	 * to 0xff and "\uHHHH" for everything else.
	 */
	SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA,

	SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA,

	XHEXA_DEFAULT_TO_UHEXA,

	UHEXA,
};

enum class JavaScriptEscapeLevel : uint_least8_t {
	LEVEL_1_BASIC_ESCAPE_SET = 1,

	LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,

	LEVEL_3_ALL_NON_ALPHANUMERIC,

	LEVEL_4_ALL_CHARACTERS,
};

std::u16string_view
JavaScriptEscape(std::u16string_view text, std::u16string &buffer,
		 JavaScriptEscapeType type=JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA,
		 JavaScriptEscapeLevel level=JavaScriptEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET);

void
JavaScriptEscape(std::span<const char16_t> src,
		 std::size_t offset, std::size_t length,
		 EscapeSink &sink,
		 JavaScriptEscapeType type, JavaScriptEscapeLevel level);

/**
 * Resolve single escape characters, "\xHH", "\uHHHH" and octal
 * escapes.
 */
std::u16string_view
JavaScriptUnescape(std::u16string_view text, std::u16string &buffer);

void
JavaScriptUnescape(std::span<const char16_t> src,
		   std::size_t offset, std::size_t length,
		   EscapeSink &sink);

} // namespace RefEscape
