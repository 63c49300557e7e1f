// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem.hpp>

class LineParser;

/**
 * Interface for parsing a line-based configuration file.
 */
class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Give this object a chance to consume the line before
	 * ParseLine() is called.
	 *
	 * @return true if the line has been consumed
	 */
	virtual bool PreParseLine(LineParser &line);

	virtual void ParseLine(LineParser &line) = 0;

	/**
	 * Called after the last line has been parsed.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores comments and empty lines.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can include other files with "@include"
 * and "@include_optional".  Relative paths are resolved against the
 * directory of the including file, and the last path component may
 * contain wildcards.
 */
class IncludeConfigParser final : public ConfigParser {
	const boost::filesystem::path path;

	ConfigParser &child;

	/**
	 * Does our Finish() override call child.Finish()?  This is
	 * false for included files, because the child shall be
	 * finished only once, after the top-level file.
	 */
	const bool finish_child;

public:
	IncludeConfigParser(boost::filesystem::path &&_path,
			    ConfigParser &_child,
			    bool _finish_child=true) noexcept
		:path(std::move(_path)), child(_child),
		 finish_child(_finish_child) {}

	const boost::filesystem::path &GetPath() const noexcept {
		return path;
	}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;

private:
	void IncludePath(boost::filesystem::path &&p);
	void IncludeOptionalPath(boost::filesystem::path &&p);
};

/**
 * Parse a configuration file line by line.  Errors are rethrown
 * nested in a LineParser::Error which contains the file name and
 * the line number.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);
