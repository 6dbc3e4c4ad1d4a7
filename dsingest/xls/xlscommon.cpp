#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>

#include "xls/xlscommon.h"

namespace dsingest {
namespace xl {

// bracketed sections and quoted literals are skipped; a ';' before any date code means
// a multi-section number format
static const std::regex _re_is_date_format(R"((?:\[[^\]]*\])|(?:"[^"]*")|(;)|([dmhysDMHYS]))");

bool is_date_format(const char* fmt)
{
	const char* fmt_end = fmt + std::strlen(fmt);
	for (std::cregex_iterator m(fmt, fmt_end, _re_is_date_format); m != std::cregex_iterator(); ++m)
	{
		if ((*m)[1].matched)
			return false;
		if ((*m)[2].matched)
			return true;
	}
	return false;
}

bool is_builtin_date_format(int id)
{
	return (id >= 14 && id <= 22) || (id >= 27 && id <= 36) || (id >= 45 && id <= 47) ||
	       (id >= 50 && id <= 58) || (id >= 71 && id <= 81);
}

static bool only_blanks(const char* s)
{
	while (*s == ' ' || *s == '\t' || *s == '\r' || *s == '\n')
		++s;
	return *s == '\0';
}

bool parse_number(const char* str, CellValue& value, bool is_date)
{
	const char* s = str;
	while (*s == ' ' || *s == '\t' || *s == '\r' || *s == '\n')
		++s;
	if (*s == '\0')
		return false;

	if (!is_date)
	{
		// plain integers keep full 64-bit precision
		const char* p = *s == '-' || *s == '+' ? s + 1 : s;
		bool digits_only = *p != '\0';
		for (const char* q = p; *q && digits_only; ++q)
			digits_only = *q >= '0' && *q <= '9';
		if (digits_only)
		{
			errno = 0;
			char* end;
			long long n = std::strtoll(s, &end, 10);
			if (errno != ERANGE)
			{
				value.set_integer(n);
				return true;
			}
		}
	}

	char* end;
	double d = std::strtod(s, &end);
	if (end == s || !only_blanks(end))
		return false;
	if (is_date)
		value.set_date(d);
	else
		value.set_double(d);
	return true;
}

}
}
