// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ReferenceTable.hxx"

/**
 * Translate a numeric HTML reference value the way HTML5 parsers
 * do: Windows-1252 for 0x80..0x9f, U+FFFD for NUL, surrogates and
 * values above U+10FFFF.
 */
[[gnu::const]]
char32_t
TranslateHtmlNumeric(char32_t value) noexcept;

/**
 * The lenient HTML reference syntax.  Legacy names like "&amp" are
 * matched even when followed by more letters.
 */
inline constexpr ReferenceSyntax html_reference_syntax{
	.upper_hex_prefix = true,
	.lenient_numeric = true,
	.partial_names = true,
	.translate_numeric = TranslateHtmlNumeric,
};

/**
 * Returns the HTML 4 table, building it on the first call.
 */
const ReferenceTable &
GetHtml4ReferenceTable();

const ReferenceTable &
GetHtml5ReferenceTable();
