// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

namespace RefEscape {

/**
 * The destination of escaped or unescaped text.  Implementations may
 * throw; the exception is propagated to the caller of the escape
 * function.
 */
class EscapeSink {
public:
	virtual ~EscapeSink() noexcept = default;

	virtual void Append(std::u16string_view s) = 0;

	virtual void Append(char16_t ch) {
		Append(std::u16string_view{&ch, 1});
	}
};

/**
 * An #EscapeSink which appends to a std::u16string.
 */
class StringEscapeSink final : public EscapeSink {
	std::u16string &dest;

public:
	explicit StringEscapeSink(std::u16string &_dest) noexcept
		:dest(_dest) {}

	void Append(std::u16string_view s) override {
		dest.append(s);
	}

	void Append(char16_t ch) override {
		dest.push_back(ch);
	}
};

} // namespace RefEscape
