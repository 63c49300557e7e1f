// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parsing and formatting HTTP dates (RFC 7231 7.1.1.1).
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/**
 * Format a time stamp as IMF-fixdate, e.g. "Sun, 06 Nov 1994
 * 08:49:37 GMT".
 */
std::string
http_date_format(std::chrono::system_clock::time_point t);

/**
 * Parse an HTTP date in one of the three formats a recipient must
 * accept: IMF-fixdate, the obsolete RFC 850 format and the ANSI C
 * asctime() format.
 *
 * @return the time stamp or std::nullopt if the string could not be
 * parsed
 */
[[gnu::pure]]
std::optional<std::chrono::system_clock::time_point>
http_date_parse(std::string_view s) noexcept;
