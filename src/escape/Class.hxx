// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <span>
#include <string>
#include <string_view>

/**
 * Describes one built-in escaping format with a uniform interface,
 * for tools which select the format at runtime.
 */
struct EscapeClass {
	const char *name;

	/**
	 * The level used if the caller does not specify one.
	 */
	unsigned default_level;

	/**
	 * Escape the given text at the given level (the numeric value
	 * of the format's level enum).  Returns #text if nothing needed
	 * to be escaped, or a view on #buffer.
	 *
	 * Throws std::invalid_argument if the level is not valid for
	 * this format.
	 */
	std::u16string_view (*escape)(std::u16string_view text,
				      std::u16string &buffer,
				      unsigned level);

	/**
	 * Unescape the given text.  Returns #text if there was
	 * nothing to unescape, or a view on #buffer.
	 */
	std::u16string_view (*unescape)(std::u16string_view text,
					std::u16string &buffer);
};

/**
 * All built-in formats.
 */
std::span<const EscapeClass>
GetEscapeClasses() noexcept;

/**
 * Look up a built-in format by name (e.g. "html5").  Returns nullptr
 * if there is no such format.
 */
[[gnu::pure]]
const EscapeClass *
FindEscapeClass(std::string_view name) noexcept;
