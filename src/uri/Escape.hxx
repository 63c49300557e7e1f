// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of URI parts.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Encode a string as "application/x-www-form-urlencoded" (HTML 4.01
 * 17.13.4.1): alphanumeric characters and ".-*_" are kept, space
 * becomes "+", and all other bytes are percent-encoded with upper
 * case hex digits.
 */
std::string
uri_form_escape(std::string_view src);

/**
 * Verify all percent-encoded triplets and convert their hex digits
 * to upper case (RFC 3986 6.2.2.1).
 *
 * @return the normalized string or std::nullopt if there is a
 * malformed escape sequence
 */
std::optional<std::string>
uri_normalize_escapes(std::string_view src);
