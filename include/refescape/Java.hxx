// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of Java string literal contents.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace RefEscape {

class EscapeSink;

enum class JavaEscapeLevel : uint_least8_t {
	/**
	 * Escape the characters which have a single escape character
	 * and all control characters.
	 */
	LEVEL_1_BASIC_ESCAPE_SET = 1,

	LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,

	LEVEL_3_ALL_NON_ALPHANUMERIC,
};

std::u16string_view
JavaEscape(std::u16string_view text, std::u16string &buffer,
	   JavaEscapeLevel level=JavaEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET);

void
JavaEscape(std::span<const char16_t> src,
	   std::size_t offset, std::size_t length,
	   EscapeSink &sink, JavaEscapeLevel level);

std::u16string_view
JavaUnescape(std::u16string_view text, std::u16string &buffer);

void
JavaUnescape(std::span<const char16_t> src,
	     std::size_t offset, std::size_t length,
	     EscapeSink &sink);

} // namespace RefEscape
