// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <span>
#include <string_view>

/**
 * One named reference of a built-in table.  #second is zero unless
 * the name expands to two codepoints.
 */
struct NamedReferenceData {
	std::string_view name;
	char32_t first, second;
};

std::span<const NamedReferenceData>
GetHtml4References() noexcept;

std::span<const NamedReferenceData>
GetHtml5References() noexcept;
