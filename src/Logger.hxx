// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>

/*
 * Log levels:
 *
 * 0 = fatal
 * 1 = error
 * 2 = warning (recoverable failures)
 * 3 = notice
 * 4 = info (per-request decisions)
 * 5 = debug
 */

void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
IsLogLevelVisible(unsigned level) noexcept;

void
LogWrite(unsigned level, std::string_view domain,
	 std::string_view message) noexcept;

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	LogVFmt(level, domain, format_str, fmt::make_format_args(args...));
}

/**
 * Log an exception (including all nested exceptions).
 */
void
LogException(unsigned level, std::string_view domain,
	     std::string_view prefix, std::exception_ptr ep) noexcept;

/**
 * A logger with a fixed domain name, usually a member of the object
 * which logs.
 */
class Logger {
	const std::string domain;

public:
	explicit Logger(std::string_view _domain)
		:domain(_domain) {}

	const std::string &GetDomain() const noexcept {
		return domain;
	}

	bool IsVisible(unsigned level) const noexcept {
		return IsLogLevelVisible(level);
	}

	void operator()(unsigned level, std::string_view message) const noexcept {
		LogWrite(level, domain, message);
	}

	void operator()(unsigned level, std::string_view prefix,
			std::exception_ptr ep) const noexcept {
		LogException(level, domain, prefix, ep);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		if (!IsLogLevelVisible(level))
			return;

		LogVFmt(level, domain, format_str,
			fmt::make_format_args(args...));
	}
};
