// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "Exception.hxx"

#include <fmt/format.h>

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

bool
IsLogLevelVisible(unsigned level) noexcept
{
	return level <= log_level.load(std::memory_order_relaxed);
}

void
LogWrite(unsigned level, std::string_view domain,
	 std::string_view message) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	/* one fprintf() call per line keeps concurrent lines from
	   being interleaved */
	fprintf(stderr, "[%.*s] %.*s\n",
		int(domain.size()), domain.data(),
		int(message.size()), message.data());
}

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
try {
	LogWrite(level, domain, fmt::vformat(format_str, args));
} catch (const std::exception &e) {
	/* out of memory or a bad format string; log what we can */
	LogWrite(level, domain, e.what());
}

void
LogException(unsigned level, std::string_view domain,
	     std::string_view prefix, std::exception_ptr ep) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	LogFmt(level, domain, "{}: {}", prefix, GetFullMessage(ep));
}
