#include <stddef.h>
#include <stdint.h>
#include <cctype>
#include <cmath>
#include <limits>
#include <regex>

#include "utility.h"

namespace dsingest {

void rtrim(std::string& s)
{
	auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); });
	s.erase(last.base(), s.end());
}

void trim(std::string& s)
{
	rtrim(s);
	auto first = std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
	s.erase(s.begin(), first);
}

bool is_integer(double v)
{
	return v >= (double)std::numeric_limits<int64_t>::min() && v < (double)std::numeric_limits<int64_t>::max() && v == std::trunc(v);
}

namespace {

const char* const _weekdays[] = { "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday" };
const char* const _months[] = { "january", "february", "march", "april", "may", "june", "july", "august", "september", "october", "november", "december" };

const std::regex _re_tz_offset(R"(([+-])(\d\d):?([0-5]\d)(?::?[0-5]\d(?:\.\d{1,6})?)?)");

// Fields collected while scanning, before conversion to a serial number
struct ScanState
{
	const char* pos;
	int year = 1904;
	int month = 1;
	int day = 1;
	bool has_date = false;
	int hour = 0;
	bool hour_12 = false;
	bool pm = false;
	int minute = 0;
	int second = 0;
	int micros = 0;
	int tz_minutes = 0;

	// Matches a full name or its three-letter abbreviation, case-insensitively; result is 1-based
	bool name(const char* const* table, size_t count, int& result)
	{
		for (size_t n = 0; n < count; ++n)
		{
			const char* word = table[n];
			size_t i = 0;
			while (word[i] != '\0' && std::tolower((unsigned char)pos[i]) == word[i])
				++i;
			if (word[i] == '\0' || i >= 3)
			{
				result = (int)n + 1;
				pos += word[i] == '\0' ? i : 3;
				return true;
			}
		}
		return false;
	}

	// Reads up to max_digits digits, returns how many were consumed
	int digits(size_t max_digits, int& result)
	{
		int value = 0;
		size_t i = 0;
		for (; i < max_digits && pos[i] >= '0' && pos[i] <= '9'; ++i)
			value = value * 10 + (pos[i] - '0');
		if (i > 0)
		{
			result = value;
			pos += i;
		}
		return (int)i;
	}

	bool timezone()
	{
		std::cmatch m;
		if (!std::regex_search(pos, m, _re_tz_offset, std::regex_constants::match_continuous))
			return false;
		int offset = std::stoi(m.str(2)) * 60 + std::stoi(m.str(3));
		tz_minutes = *pos == '+' ? -offset : offset;
		pos += m.length();
		return true;
	}

	bool directive(char code)
	{
		int unused;
		switch (code)
		{
		case 'a': case 'A': return name(_weekdays, 7, unused);
		case 'b': case 'B': return has_date = name(_months, 12, month);
		case 'd': return has_date = digits(2, day) > 0 && day > 0;
		case 'm': return has_date = digits(2, month) > 0 && month > 0 && month <= 12;
		case 'y':
			if (digits(2, year) != 2)
				return false;
			year += year < 68 ? 2000 : 1900;
			return has_date = true;
		case 'Y': return has_date = digits(4, year) == 4 && year > 0;
		case 'H':
			hour_12 = false;
			return digits(2, hour) > 0 && hour <= 23;
		case 'I':
			if (!digits(2, hour) || hour == 0 || hour > 12)
				return false;
			hour %= 12;
			return hour_12 = true;
		case 'p':
		{
			char c0 = (char)std::tolower((unsigned char)pos[0]);
			if ((c0 != 'a' && c0 != 'p') || std::tolower((unsigned char)pos[1]) != 'm')
				return false;
			pm = c0 == 'p';
			pos += 2;
			return true;
		}
		case 'M': return digits(2, minute) > 0 && minute <= 59;
		case 'S': return digits(2, second) > 0 && second <= 59;
		case 'f':
		{
			int n = digits(6, micros);
			for (; n > 0 && n < 6; ++n)
				micros *= 10;
			return n > 0;
		}
		case 'z': return timezone();
		case 'Z':
			while (std::isalnum((unsigned char)*pos))
				++pos;
			return true;
		case '%': return *pos++ == '%';
		default: return false;
		}
	}

	bool valid_day() const
	{
		static const int days_in_month[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
		bool leap = year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
		return day <= days_in_month[month - 1] + (month == 2 && leap);
	}

	// days_from_civil, shifted to the Excel epoch
	double date_serial() const
	{
		int y = year - (month <= 2);
		int era = (y >= 0 ? y : y - 399) / 400;
		unsigned yoe = (unsigned)(y - era * 400);
		unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
		unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
		return era * 146097.0 + (double)doe - 719468.0 + EXCEL_UNIX_EPOCH;
	}
};

}

bool strptime(const std::string& src, const std::string& fmt, double& dt)
{
	ScanState st { src.c_str() };
	for (const char* f = fmt.c_str(); *f; ++f)
	{
		if (*f == '%')
		{
			if (!st.directive(*++f))
				return false;
		}
		else if (std::isspace((unsigned char)*f))
		{
			while (std::isspace((unsigned char)*st.pos))
				++st.pos;
		}
		else if (*st.pos++ != *f)
			return false;
	}
	if (*st.pos != '\0')
		return false;

	int hour = st.hour + (st.hour_12 && st.pm ? 12 : 0);
	dt = (hour * 3600 + (st.minute + st.tz_minutes) * 60 + st.second + st.micros / 1000000.0) / 86400.0;
	if (st.has_date)
	{
		if (!st.valid_day())
			return false;
		dt += st.date_serial();
	}
	else if (st.tz_minutes != 0)
	{
		dt -= std::floor(dt);
	}
	return true;
}

CivilDate serial_to_civil(double serial)
{
	// civil_from_days on the day count relative to 1970-01-01
	int64_t z = (int64_t)std::floor(serial) - (int64_t)EXCEL_UNIX_EPOCH + 719468;
	int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	unsigned doe = (unsigned)(z - era * 146097);
	unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	unsigned mp = (5 * doy + 2) / 153;
	CivilDate d;
	d.day = (int)(doy - (153 * mp + 2) / 5 + 1);
	d.month = (int)(mp < 10 ? mp + 3 : mp - 9);
	d.year = (int)(yoe + era * 400) + (d.month <= 2);
	return d;
}

}
