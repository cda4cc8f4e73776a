// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <string>

/**
 * Obtain the full concatenated message of an exception and its
 * nested chain, separated by ": ".
 */
[[gnu::pure]]
std::string
GetFullMessage(std::exception_ptr ep) noexcept;

/**
 * Print the full message of the given exception to stderr.
 */
void
PrintException(std::exception_ptr ep) noexcept;
