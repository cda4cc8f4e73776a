// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Class.hxx"
#include "refescape/Html.hxx"
#include "refescape/Xml.hxx"
#include "refescape/Json.hxx"
#include "refescape/JavaScript.hxx"
#include "refescape/Java.hxx"
#include "refescape/Css.hxx"
#include "refescape/Uri.hxx"

using namespace RefEscape;

static constexpr EscapeClass escape_classes[] = {
	{
		"html4", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return HtmlEscape(text, buffer,
					  HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
					  HtmlEscapeLevel(level));
		},
		HtmlUnescape,
	},
	{
		"html5", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return HtmlEscape(text, buffer,
					  HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
					  HtmlEscapeLevel(level));
		},
		HtmlUnescape,
	},
	{
		"xml10", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return Xml10Escape(text, buffer,
					   XmlEscapeType::CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_HEXA,
					   XmlEscapeLevel(level));
		},
		XmlUnescape,
	},
	{
		"xml11", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return Xml11Escape(text, buffer,
					   XmlEscapeType::CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_HEXA,
					   XmlEscapeLevel(level));
		},
		XmlUnescape,
	},
	{
		"json", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return JsonEscape(text, buffer,
					  JsonEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA,
					  JsonEscapeLevel(level));
		},
		JsonUnescape,
	},
	{
		"javascript", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return JavaScriptEscape(text, buffer,
						JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA,
						JavaScriptEscapeLevel(level));
		},
		JavaScriptUnescape,
	},
	{
		"java", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return JavaEscape(text, buffer, JavaEscapeLevel(level));
		},
		JavaUnescape,
	},
	{
		"css-string", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return CssStringEscape(text, buffer,
					       CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,
					       CssStringEscapeLevel(level));
		},
		CssUnescape,
	},
	{
		"css-identifier", 2,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned level) {
			return CssIdentifierEscape(text, buffer,
						   CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,
						   CssIdentifierEscapeLevel(level));
		},
		CssUnescape,
	},
	/* URI escaping has no levels; the level is ignored */
	{
		"uri-path", 0,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned) {
			return UriEscape(text, buffer, UriEscapeType::PATH);
		},
		[](std::u16string_view text, std::u16string &buffer) {
			return UriUnescape(text, buffer, UriEscapeType::PATH);
		},
	},
	{
		"uri-segment", 0,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned) {
			return UriEscape(text, buffer, UriEscapeType::PATH_SEGMENT);
		},
		[](std::u16string_view text, std::u16string &buffer) {
			return UriUnescape(text, buffer, UriEscapeType::PATH_SEGMENT);
		},
	},
	{
		"uri-query", 0,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned) {
			return UriEscape(text, buffer, UriEscapeType::QUERY_PARAM);
		},
		[](std::u16string_view text, std::u16string &buffer) {
			return UriUnescape(text, buffer, UriEscapeType::QUERY_PARAM);
		},
	},
	{
		"uri-fragment", 0,
		[](std::u16string_view text, std::u16string &buffer,
		   unsigned) {
			return UriEscape(text, buffer, UriEscapeType::FRAGMENT_ID);
		},
		[](std::u16string_view text, std::u16string &buffer) {
			return UriUnescape(text, buffer, UriEscapeType::FRAGMENT_ID);
		},
	},
};

std::span<const EscapeClass>
GetEscapeClasses() noexcept
{
	return escape_classes;
}

const EscapeClass *
FindEscapeClass(std::string_view name) noexcept
{
	for (const auto &i : escape_classes)
		if (name == i.name)
			return &i;

	return nullptr;
}
