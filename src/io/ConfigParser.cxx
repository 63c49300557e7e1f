// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"

#include <algorithm>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <errno.h>
#include <fnmatch.h>
#include <stdio.h>

namespace fs = boost::filesystem;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

bool
IncludeConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(LineParser &line)
{
	if (line.SkipWord("@include")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludePath(p);
	} else if (line.SkipWord("@include_optional")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludeOptionalPath(p);
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	if (finish_child)
		child.Finish();
}

static fs::path
ApplyPath(const fs::path &base, fs::path &&p)
{
	if (p.is_absolute())
		/* is already absolute */
		return std::move(p);

	return base.parent_path() / p;
}

namespace {

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

using UniqueFile = std::unique_ptr<FILE, FileCloser>;

}

static void
ParseConfigFile(const fs::path &path, FILE *file, ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(path.native() + ':' + std::to_string(i)));
		}

		++i;
	}
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	p = ApplyPath(path, std::move(p));

	auto directory = p.parent_path();
	if (directory.empty())
		directory = ".";

	const auto pattern = p.filename();

	if (pattern.native().find('*') != std::string::npos ||
	    pattern.native().find('?') != std::string::npos) {
		std::vector<fs::path> files;

		for (const auto &i : fs::directory_iterator(directory))
			if (fnmatch(pattern.c_str(), i.path().filename().c_str(), 0) == 0)
				files.emplace_back(i.path());

		std::sort(files.begin(), files.end());

		for (auto &i : files) {
			IncludeConfigParser sub(std::move(i), child, false);
			ParseConfigFile(sub.GetPath(), sub);
		}
	} else {
		IncludeConfigParser sub(std::move(p), child, false);
		ParseConfigFile(sub.GetPath(), sub);
	}
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	IncludeConfigParser sub(ApplyPath(path, std::move(p)), child, false);

	UniqueFile file(fopen(sub.GetPath().c_str(), "r"));
	if (!file) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			throw std::system_error(e, std::system_category(),
						"Failed to open " + sub.GetPath().native());
		}
	}

	ParseConfigFile(sub.GetPath(), file.get(), sub);
	sub.Finish();
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	UniqueFile file(fopen(path.c_str(), "r"));
	if (!file)
		throw std::system_error(errno, std::system_category(),
					"Failed to open " + path.native());

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
}
