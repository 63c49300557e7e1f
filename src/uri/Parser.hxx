// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Splitting and resolving URI references (RFC 3986).
 */

#pragma once

#include <string>
#include <string_view>

/**
 * The components of a URI reference.  All string views point into
 * the string passed to Parse().
 */
struct UriParts {
	std::string_view scheme;
	std::string_view userinfo;
	std::string_view host;

	/**
	 * The port digits (may be empty even if there is a colon).
	 */
	std::string_view port;

	std::string_view path;
	std::string_view query;
	std::string_view fragment;

	bool has_authority = false;
	bool has_userinfo = false;
	bool has_query = false;
	bool has_fragment = false;

	/**
	 * Split the URI reference into its components and verify its
	 * syntax: forbidden characters, malformed percent escapes,
	 * malformed IP literals and invalid port numbers are
	 * rejected.
	 *
	 * @return false if the URI is malformed
	 */
	bool Parse(std::string_view src) noexcept;

	bool IsAbsolute() const noexcept {
		return !scheme.empty();
	}

	/**
	 * @return the port number, or -1 if none was specified
	 */
	[[gnu::pure]]
	int GetPort() const noexcept;

	/**
	 * Recompose the URI reference (RFC 3986 5.3).
	 */
	std::string ToString() const;
};

/**
 * Remove "." and ".." segments from a path (RFC 3986 5.2.4).
 */
std::string
uri_remove_dot_segments(std::string_view path);

/**
 * Resolve a URI reference against an absolute base URI (RFC 3986
 * 5.2.2).
 *
 * Throws std::invalid_argument if one of the URIs is malformed or
 * the base is not absolute.
 */
std::string
uri_resolve(std::string_view base, std::string_view reference);
