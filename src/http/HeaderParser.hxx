// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parse HTTP headers into a StringMap.
 */

#pragma once

#include <string_view>

class StringMap;

/**
 * Parse one "name: value" line and add it to the map.
 *
 * @return true on success, false on error
 */
bool
header_parse_line(StringMap &headers, std::string_view line);

/**
 * Parse a block of header lines separated by "\n" or "\r\n".
 * Malformed lines are skipped.
 */
void
header_parse_buffer(StringMap &headers, std::string_view buffer);
