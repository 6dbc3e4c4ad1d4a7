#ifndef DSINGEST_UTILITY_H
#define DSINGEST_UTILITY_H

#include <string>
#include <string_view>
#include <algorithm>

namespace dsingest {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

struct startswith
{
	startswith(std::string_view prefix) : m_prefix(prefix) {}
	bool operator () (std::string_view s) const
	{ return s.size() >= m_prefix.size() && std::equal(m_prefix.begin(), m_prefix.end(), s.begin()); }
private:
	std::string_view m_prefix;
};

void rtrim(std::string& s);
void trim(std::string& s);

bool is_integer(double v);

// Excel serial day numbers: days since 1899-12-30, fraction is the time of day
constexpr double EXCEL_UNIX_EPOCH = 25569.0;

// Parses src with a strptime-like format into an Excel serial number.
// Supported codes: %a %b %d %m %y %Y %H %I %p %M %S %f %z %Z %%.
bool strptime(const std::string& src, const std::string& fmt, double& dt);

struct CivilDate
{
	int year;
	int month;
	int day;
};

// Calendar date of the integer part of an Excel serial number
CivilDate serial_to_civil(double serial);

}

#endif
