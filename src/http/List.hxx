// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Comma separated HTTP header lists (RFC 7230 7).
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * Split a comma separated list into its items.  Whitespace around
 * items is removed, empty items are skipped, and commas inside
 * quoted strings do not split.  The returned views point into the
 * input.
 */
std::vector<std::string_view>
http_list_split_raw(std::string_view list);

/**
 * Like http_list_split_raw(), but convert all items to lower case
 * (for lists of header names or tokens).
 */
std::vector<std::string>
http_list_split(std::string_view list);

/**
 * Does the list contain the specified item (case sensitive)?
 */
[[gnu::pure]]
bool
http_list_contains(std::string_view list, std::string_view item) noexcept;

/**
 * Case-insensitive version of http_list_contains().
 */
[[gnu::pure]]
bool
http_list_contains_i(std::string_view list, std::string_view item) noexcept;
