// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Host.hxx"

#include <fmt/core.h>

std::string
HttpHost::ToURI() const
{
	const std::string_view s = scheme.empty() ? "http" : scheme;

	if (port < 0)
		return fmt::format("{}://{}", s, hostname);

	return fmt::format("{}://{}:{}", s, hostname, port);
}
