// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Date.hxx"
#include "strutil.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <time.h>

static constexpr const char *wdays[] = {
	"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat",
};

static constexpr const char *months[] = {
	"Jan", "Feb", "Mar", "Apr", "May", "Jun",
	"Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

std::string
http_date_format(std::chrono::system_clock::time_point t)
{
	const time_t tt = std::chrono::system_clock::to_time_t(t);
	struct tm tm;
	if (gmtime_r(&tt, &tm) == nullptr)
		throw std::invalid_argument("Time stamp out of range");

	return fmt::format("{}, {:02} {} {:04} {:02}:{:02}:{:02} GMT",
			   wdays[tm.tm_wday], tm.tm_mday, months[tm.tm_mon],
			   tm.tm_year + 1900,
			   tm.tm_hour, tm.tm_min, tm.tm_sec);
}

namespace {

/**
 * A tiny cursor over the date string.
 */
class DateReader {
	std::string_view s;

public:
	explicit constexpr DateReader(std::string_view _s) noexcept:s(_s) {}

	bool IsEnd() const noexcept {
		return s.empty();
	}

	bool Skip(char ch) noexcept {
		if (s.empty() || s.front() != ch)
			return false;

		s = s.substr(1);
		return true;
	}

	void SkipSpaces() noexcept {
		while (Skip(' ')) {}
	}

	/**
	 * Read a number with the given minimum and maximum number of
	 * digits.
	 *
	 * @return the number or -1 on error
	 */
	int ReadNumber(std::size_t min_digits, std::size_t max_digits) noexcept {
		std::size_t n = 0;
		int value = 0;

		while (n < max_digits && n < s.size() && IsDigitASCII(s[n])) {
			value = value * 10 + (s[n] - '0');
			++n;
		}

		if (n < min_digits)
			return -1;

		s = s.substr(n);
		return value;
	}

	std::string_view ReadAlpha() noexcept {
		std::size_t n = 0;
		while (n < s.size() && IsAlphaASCII(s[n]))
			++n;

		auto result = s.substr(0, n);
		s = s.substr(n);
		return result;
	}

	/**
	 * Read "HH:MM:SS".
	 */
	bool ReadTime(struct tm &tm) noexcept {
		tm.tm_hour = ReadNumber(2, 2);
		if (tm.tm_hour < 0 || !Skip(':'))
			return false;

		tm.tm_min = ReadNumber(2, 2);
		if (tm.tm_min < 0 || !Skip(':'))
			return false;

		tm.tm_sec = ReadNumber(2, 2);
		return tm.tm_sec >= 0;
	}

	bool ReadGMT() noexcept {
		return ReadAlpha() == "GMT";
	}
};

}

[[gnu::pure]]
static int
ParseMonthName(std::string_view name) noexcept
{
	for (int i = 0; i < 12; ++i)
		if (StringIsEqualIgnoreCase(name, months[i]))
			return i;

	return -1;
}

[[gnu::pure]]
static bool
IsWeekdayName(std::string_view name) noexcept
{
	if (name.size() < 3)
		return false;

	for (const char *wday : wdays)
		if (StringIsEqualIgnoreCase(name.substr(0, 3), wday))
			return true;

	return false;
}

/**
 * IMF-fixdate: "Sun, 06 Nov 1994 08:49:37 GMT"
 */
static bool
ParseImfFixdate(DateReader r, struct tm &tm) noexcept
{
	r.SkipSpaces();

	tm.tm_mday = r.ReadNumber(1, 2);
	if (tm.tm_mday < 0 || !r.Skip(' '))
		return false;

	tm.tm_mon = ParseMonthName(r.ReadAlpha());
	if (tm.tm_mon < 0 || !r.Skip(' '))
		return false;

	tm.tm_year = r.ReadNumber(4, 4);
	if (tm.tm_year < 0 || !r.Skip(' '))
		return false;

	tm.tm_year -= 1900;

	if (!r.ReadTime(tm) || !r.Skip(' ') || !r.ReadGMT())
		return false;

	r.SkipSpaces();
	return r.IsEnd();
}

/**
 * Obsolete RFC 850 format: "Sunday, 06-Nov-94 08:49:37 GMT"
 */
static bool
ParseRfc850(DateReader r, struct tm &tm) noexcept
{
	r.SkipSpaces();

	tm.tm_mday = r.ReadNumber(2, 2);
	if (tm.tm_mday < 0 || !r.Skip('-'))
		return false;

	tm.tm_mon = ParseMonthName(r.ReadAlpha());
	if (tm.tm_mon < 0 || !r.Skip('-'))
		return false;

	const int year = r.ReadNumber(2, 2);
	if (year < 0 || !r.Skip(' '))
		return false;

	/* RFC 7231 7.1.1.1: a two-digit year which appears to be
	   more than 50 years in the future is in the past; this
	   simplified interpretation pivots at 1970 */
	tm.tm_year = year < 70 ? year + 100 : year;

	if (!r.ReadTime(tm) || !r.Skip(' ') || !r.ReadGMT())
		return false;

	r.SkipSpaces();
	return r.IsEnd();
}

/**
 * ANSI C asctime() format: "Sun Nov  6 08:49:37 1994"
 */
static bool
ParseAsctime(DateReader r, struct tm &tm) noexcept
{
	tm.tm_mon = ParseMonthName(r.ReadAlpha());
	if (tm.tm_mon < 0 || !r.Skip(' '))
		return false;

	r.SkipSpaces();

	tm.tm_mday = r.ReadNumber(1, 2);
	if (tm.tm_mday < 0 || !r.Skip(' ') || !r.ReadTime(tm) ||
	    !r.Skip(' '))
		return false;

	tm.tm_year = r.ReadNumber(4, 4);
	if (tm.tm_year < 0)
		return false;

	tm.tm_year -= 1900;

	r.SkipSpaces();
	return r.IsEnd();
}

std::optional<std::chrono::system_clock::time_point>
http_date_parse(std::string_view s) noexcept
{
	s = Strip(s);

	DateReader r(s);
	if (!IsWeekdayName(r.ReadAlpha()))
		return std::nullopt;

	struct tm tm{};
	bool success;
	if (r.Skip(','))
		success = ParseImfFixdate(r, tm) || ParseRfc850(r, tm);
	else if (r.Skip(' '))
		success = ParseAsctime(r, tm);
	else
		success = false;

	if (!success || tm.tm_mday < 1 || tm.tm_mday > 31 ||
	    tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
		return std::nullopt;

	tm.tm_isdst = 0;

	const time_t t = timegm(&tm);
	if (t == (time_t)-1)
		return std::nullopt;

	return std::chrono::system_clock::from_time_t(t);
}
