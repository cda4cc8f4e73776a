// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class ReferenceTable;

/**
 * Is this codepoint allowed in an XML 1.0 document?
 */
[[gnu::const]]
bool
IsValidXml10(char32_t codepoint) noexcept;

/**
 * Is this codepoint allowed in an XML 1.1 document?
 */
[[gnu::const]]
bool
IsValidXml11(char32_t codepoint) noexcept;

const ReferenceTable &
GetXml10ReferenceTable();

const ReferenceTable &
GetXml11ReferenceTable();
