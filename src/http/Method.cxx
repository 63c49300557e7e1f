// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Method.hxx"

#include <array>

static constexpr std::array method_names{
	"HEAD",
	"GET",
	"POST",
	"PUT",
	"DELETE",
	"OPTIONS",
	"TRACE",
	"PATCH",
	"CONNECT",
};

const char *
http_method_to_string(HttpMethod method) noexcept
{
	const std::size_t i = std::size_t(method);
	if (i == 0 || i > method_names.size())
		return nullptr;

	return method_names[i - 1];
}

HttpMethod
http_method_parse(std::string_view name) noexcept
{
	for (std::size_t i = 0; i < method_names.size(); ++i)
		if (name == method_names[i])
			return HttpMethod(i + 1);

	return HttpMethod::INVALID;
}
