// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "strutil.hxx"

#include <chrono>
#include <cstdint>
#include <stdexcept>

/**
 * Tokenize one line of a configuration file.  The line buffer is
 * modified in place (terminators are inserted after each token).
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept;

	LineParser(const LineParser &) = delete;
	LineParser &operator=(const LineParser &) = delete;

	char *Rest() noexcept {
		return p;
	}

	void Strip() noexcept {
		while (IsWhitespaceNotNull(*p))
			++p;
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectWhitespace() {
		if (!IsWhitespaceNotNull(front()))
			throw Error("Syntax error");

		++p;
		Strip();
	}

	void ExpectEnd();

	bool SkipSymbol(char symbol) noexcept {
		bool found = front() == symbol;
		if (found)
			++p;
		return found;
	}

	/**
	 * If the next word matches the given parameter, then skip it
	 * and return true.  If not, the method returns false, leaving
	 * the object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	const char *NextWord() noexcept;
	char *NextValue() noexcept;
	char *NextUnescape() noexcept;

	bool NextBool();

	/**
	 * Parse a non-negative integer.  A suffix "k", "M" or "G"
	 * multiplies the value with 1024, 1024^2 or 1024^3.
	 */
	uint_least64_t NextSize();

	unsigned NextPositiveInteger();

	/**
	 * Parse a non-negative decimal fraction such as "0.1".
	 */
	double NextDouble();

	/**
	 * Parse a duration in seconds; the suffixes "s", "m", "h" and
	 * "d" are allowed.
	 */
	std::chrono::seconds NextDuration();

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

private:
	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
			ch == '/' || ch == '*';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
