// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * Splits one line of a configuration file into words and values.
 * The line is modified in place (null terminators are inserted).
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	/**
	 * @param _p a null-terminated line; leading and trailing
	 * whitespace (including the newline) is removed
	 */
	explicit LineParser(char *_p) noexcept;

	LineParser(const LineParser &) = delete;
	LineParser &operator=(const LineParser &) = delete;

	void Strip() noexcept;

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd();

	bool SkipSymbol(char symbol) noexcept {
		bool found = front() == symbol;
		if (found)
			++p;
		return found;
	}

	/**
	 * If the next word matches the given parameter, then skip it and
	 * return true.  If not, the method returns false, leaving the
	 * object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	const char *NextWord() noexcept;
	char *NextValue() noexcept;

	/**
	 * Parse a quoted string with backslash escapes.  Returns
	 * nullptr on syntax error.
	 */
	char *NextUnescape() noexcept;

	/**
	 * Parse a non-negative decimal integer.  Throws on error.
	 */
	unsigned NextUnsigned();

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

private:
	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;
};
