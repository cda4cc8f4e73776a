// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Write one codepoint as UTF-8 into the given buffer, which must have
 * room for at least 4 bytes.  Returns the end of the sequence.
 */
char *
UnicodeToUTF8(char32_t ch, char *q) noexcept;

/**
 * Convert UTF-8 to UTF-16.  Malformed sequences are replaced with
 * U+FFFD.
 */
std::u16string
UTF8ToUTF16(std::string_view src);

/**
 * Convert UTF-16 to UTF-8.  Lone surrogates are replaced with U+FFFD.
 */
std::string
UTF16ToUTF8(std::u16string_view src);
