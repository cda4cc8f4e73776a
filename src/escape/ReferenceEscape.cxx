// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ReferenceEscape.hxx"
#include "ReferenceTable.hxx"
#include "OutputBuffer.hxx"
#include "util/UTF16.hxx"
#include "refescape/Sink.hxx"

#include <fmt/format.h>

#include <array>

void
AppendNumericReference(const ReferenceTable &table, char32_t codepoint,
		       bool hexa, RefEscape::EscapeSink &sink)
{
	const auto &syntax = table.GetSyntax();

	std::array<char, 16> digits;
	const char *end = hexa
		? fmt::format_to(digits.data(), "{:x}", uint_least32_t(codepoint))
		: fmt::format_to(digits.data(), "{}", uint_least32_t(codepoint));

	std::array<char16_t, 24> buffer;
	std::size_t n = 0;
	buffer[n++] = syntax.marker;
	buffer[n++] = syntax.numeric_marker;
	if (hexa)
		buffer[n++] = u'x';

	for (const char *p = digits.data(); p != end; ++p)
		buffer[n++] = char16_t(*p);

	buffer[n++] = syntax.terminator;

	sink.Append(std::u16string_view{buffer.data(), n});
}

static void
AppendReference(const ReferenceTable &table, char32_t codepoint,
		ReferenceEscapeType type, RefEscape::EscapeSink &sink)
{
	if (type.use_names) {
		const auto name = table.FindName(codepoint);
		if (!name.empty()) {
			sink.Append(name);
			return;
		}
	}

	AppendNumericReference(table, codepoint, type.use_hexa, sink);
}

bool
EscapeReferences(const ReferenceTable &table, std::u16string_view text,
		 RefEscape::EscapeSink &sink,
		 ReferenceEscapeType type, unsigned level)
{
	/* copying of unmodified characters is deferred until the
	   first one which needs to be escaped */
	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = 0; i < text.size();) {
		const auto c = ReadCodepoint(text, i);
		const bool valid = table.IsValid(c.codepoint);

		if (valid && !table.MustEscape(c.codepoint, level)) {
			i += c.units;
			continue;
		}

		if (i > copy_from)
			sink.Append(text.substr(copy_from, i - copy_from));
		modified = true;

		if (valid)
			AppendReference(table, c.codepoint, type, sink);

		i += c.units;
		copy_from = i;
	}

	if (!modified)
		return false;

	if (copy_from < text.size())
		sink.Append(text.substr(copy_from));
	return true;
}

std::u16string_view
EscapeReferences(const ReferenceTable &table, std::u16string_view text,
		 std::u16string &buffer,
		 ReferenceEscapeType type, unsigned level)
{
	return WriteToBuffer(text, buffer, text.size() + 20,
			     [&](RefEscape::EscapeSink &sink){
				     return EscapeReferences(table, text, sink, type, level);
			     });
}
