// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <span>
#include <string_view>

/**
 * Return the given range of the buffer.
 *
 * Throws std::invalid_argument if the range exceeds the buffer.
 */
std::u16string_view
CheckRange(std::span<const char16_t> buffer,
	   std::size_t offset, std::size_t length);
