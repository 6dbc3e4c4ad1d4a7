#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>

#include "inferrer.h"
#include "utility.h"
#include "xls/xlscommon.h"

namespace dsingest {

namespace {

struct TypeNames
{
	ColumnType type;
	const char* name;
	const char* sql;
};

const TypeNames _type_names[] = {
	{ ColumnType::Integer, "integer", "INTEGER" },
	{ ColumnType::BigInteger, "big-integer", "BIGINT" },
	{ ColumnType::Double, "double", "DOUBLE" },
	{ ColumnType::Date, "date", "DATE" },
	{ ColumnType::Timestamp, "timestamp", "TIMESTAMP" },
	{ ColumnType::Boolean, "boolean", "BOOLEAN" },
	{ ColumnType::String, "string", "VARCHAR" },
};

const std::unordered_map<std::string, ColumnType> _type_aliases {
	{"int", ColumnType::Integer}, {"int4", ColumnType::Integer},
	{"bigint", ColumnType::BigInteger}, {"int8", ColumnType::BigInteger}, {"long", ColumnType::BigInteger},
	{"float", ColumnType::Double}, {"float8", ColumnType::Double}, {"real", ColumnType::Double}, {"decimal", ColumnType::Double}, {"numeric", ColumnType::Double},
	{"datetime", ColumnType::Timestamp},
	{"bool", ColumnType::Boolean},
	{"varchar", ColumnType::String}, {"text", ColumnType::String}, {"str", ColumnType::String},
};

}

const char* ColumnTypeName(ColumnType type)
{
	return _type_names[static_cast<size_t>(type)].name;
}

const char* ColumnTypeSql(ColumnType type)
{
	return _type_names[static_cast<size_t>(type)].sql;
}

duckdb::LogicalType ToLogicalType(ColumnType type)
{
	switch (type)
	{
	case ColumnType::Integer: return duckdb::LogicalType::INTEGER;
	case ColumnType::BigInteger: return duckdb::LogicalType::BIGINT;
	case ColumnType::Double: return duckdb::LogicalType::DOUBLE;
	case ColumnType::Date: return duckdb::LogicalType::DATE;
	case ColumnType::Timestamp: return duckdb::LogicalType::TIMESTAMP;
	case ColumnType::Boolean: return duckdb::LogicalType::BOOLEAN;
	default: return duckdb::LogicalType::VARCHAR;
	}
}

bool FromLogicalType(const duckdb::LogicalType& type, ColumnType& result)
{
	switch (type.id())
	{
	case duckdb::LogicalTypeId::INTEGER: result = ColumnType::Integer; return true;
	case duckdb::LogicalTypeId::BIGINT: result = ColumnType::BigInteger; return true;
	case duckdb::LogicalTypeId::DOUBLE: result = ColumnType::Double; return true;
	case duckdb::LogicalTypeId::DATE: result = ColumnType::Date; return true;
	case duckdb::LogicalTypeId::TIMESTAMP: result = ColumnType::Timestamp; return true;
	case duckdb::LogicalTypeId::BOOLEAN: result = ColumnType::Boolean; return true;
	case duckdb::LogicalTypeId::VARCHAR: result = ColumnType::String; return true;
	default: return false;
	}
}

bool ParseColumnType(const std::string& name, ColumnType& result)
{
	std::string lower = boost::algorithm::to_lower_copy(name);
	trim(lower);
	for (const TypeNames& tn : _type_names)
		if (lower == tn.name || lower == boost::algorithm::to_lower_copy(std::string(tn.sql)))
		{
			result = tn.type;
			return true;
		}
	auto it = _type_aliases.find(lower);
	if (it == _type_aliases.end())
		return false;
	result = it->second;
	return true;
}

std::string ValidColumnTypeList()
{
	std::string res;
	for (const TypeNames& tn : _type_names)
	{
		if (!res.empty())
			res += ", ";
		res += tn.sql;
	}
	return res;
}

bool cell_empty(const CellRaw& cell)
{
	const std::string* s = std::get_if<std::string>(&cell);
	return s && s->empty();
}

static std::string serial_to_string(double value, bool with_time)
{
	CivilDate date = serial_to_civil(value);
	std::ostringstream ss;
	ss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month << '-' << std::setw(2) << date.day;
	if (with_time)
	{
		int64_t secs = std::llround((value - std::floor(value)) * 86400.0);
		ss << ' ' << std::setw(2) << secs / 3600 << ':' << std::setw(2) << secs % 3600 / 60 << ':' << std::setw(2) << secs % 60;
	}
	return ss.str();
}

std::string cell_to_string(const CellRaw& cell)
{
	return std::visit(overloaded{
	[](const std::string& s) { return s; },
	[](int64_t v) { return std::to_string(v); },
	[](bool v) { return std::string(v ? "true" : "false"); },
	[](double v) { return duckdb::Value::DOUBLE(v).ToString(); },
	[](const CellRawDate& v) { return serial_to_string(v.d, v.d != std::trunc(v.d)); },
	}, cell);
}

namespace {

const std::unordered_map<std::string, bool> _bool_dict {
	{"false", false}, {"False", false}, {"FALSE", false}, {"true", true}, {"True", true}, {"TRUE", true},
	{"no", false}, {"No", false}, {"NO", false}, {"yes", true}, {"Yes", true}, {"YES", true}
};

// IEEE doubles keep 15 significant decimal digits exactly
const int MAX_DOUBLE_DIGITS = 15;

const std::regex _re_check_integer(R"(0|-?[1-9]\d*)");
const std::regex _re_check_decimal(R"([+-]?(0|[1-9]\d*|\d+\.|\d*\.\d+)(?:[eE][+-]?\d+)?)");

int significant_digits(const std::string& mantissa)
{
	int n = 0;
	bool leading = true;
	for (char c : mantissa)
	{
		if (c < '0' || c > '9')
			continue;
		if (leading && c == '0')
			continue;
		leading = false;
		++n;
	}
	// trailing zeros after the point do not add precision
	size_t dot = mantissa.find('.');
	if (dot != std::string::npos)
		for (size_t i = mantissa.size(); i > dot + 1 && mantissa[i - 1] == '0' && n > 0; --i)
			--n;
	return n;
}

bool fits_double(int64_t v)
{
	std::string digits = std::to_string(v);
	return digits.size() - (v < 0) <= (size_t)MAX_DOUBLE_DIGITS;
}

bool parse_int64(const std::string& s, int64_t& v)
{
	if (!std::regex_match(s, _re_check_integer))
		return false;
	errno = 0;
	char* end;
	long long n = std::strtoll(s.c_str(), &end, 10);
	if (errno == ERANGE || *end)
		return false;
	v = n;
	return true;
}

class TBoolean
{
public:
	int infer(const CellRaw& cell)
	{
		if (!m_valid)
			return 0;
		return m_valid = std::visit(overloaded{
		[](const std::string& s) -> bool { return _bool_dict.find(s) != _bool_dict.end(); },
		[](bool v) -> bool { return true; },
		[](auto v) -> bool { return false; },
		}, cell);
	}

	bool create_schema(InferredColumn& col) const
	{
		if (m_valid)
			col.type = ColumnType::Boolean;
		return m_valid;
	}

	bool m_valid = true;
};

class TInteger
{
public:
	int infer(const CellRaw& cell)
	{
		if (!m_valid)
			return 0;
		return m_valid = std::visit(overloaded{
		[this](const std::string& s) -> bool
		{
			int64_t v;
			return parse_int64(s, v) && note(v);
		},
		[this](int64_t v) -> bool { return note(v); },
		[this](double v) -> bool { return is_integer(v) && note((int64_t)v); },
		[](auto v) -> bool { return false; },
		}, cell);
	}

	bool create_schema(InferredColumn& col) const
	{
		if (m_valid)
			col.type = m_big ? ColumnType::BigInteger : ColumnType::Integer;
		return m_valid;
	}

	bool m_valid = true;
	bool m_big = false;

private:
	bool note(int64_t v)
	{
		if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max())
			m_big = true;
		return true;
	}
};

class TDecimal
{
public:
	int infer(const CellRaw& cell)
	{
		if (!m_valid)
			return 0;
		return m_valid = std::visit(overloaded{
		[](const std::string& s) -> bool
		{
			std::smatch m;
			return std::regex_match(s, m, _re_check_decimal) && significant_digits(m.str(1)) <= MAX_DOUBLE_DIGITS;
		},
		[](int64_t v) -> bool { return fits_double(v); },
		[](double v) -> bool { return std::isfinite(v); },
		[](auto v) -> bool { return false; },
		}, cell);
	}

	bool create_schema(InferredColumn& col) const
	{
		if (m_valid)
			col.type = ColumnType::Double;
		return m_valid;
	}

	bool m_valid = true;
};

const std::unordered_map<std::string, char> _dt_tokens {
	{"utc", 'Z'}, {"gmt", 'Z'},
	{"am", 'p'}, {"pm", 'p'},
	{"sunday", 'a'}, {"monday", 'a'}, {"tuesday", 'a'}, {"wednesday", 'a'}, {"thursday", 'a'}, {"friday", 'a'}, {"saturday", 'a'},
	{"sun", 'a'}, {"mon", 'a'}, {"tue", 'a'}, {"wed", 'a'}, {"thu", 'a'}, {"fri", 'a'}, {"sat", 'a'},
	{"january", 'b'}, {"february", 'b'}, {"march", 'b'}, {"april", 'b'}, {"may", 'b'}, {"june", 'b'}, {"july", 'b'}, {"august", 'b'}, {"september", 'b'}, {"october", 'b'}, {"november", 'b'}, {"december", 'b'},
	{"jan", 'b'}, {"feb", 'b'}, {"mar", 'b'}, {"apr", 'b'}, {"jun", 'b'}, {"jul", 'b'}, {"aug", 'b'}, {"sep", 'b'}, {"oct", 'b'}, {"nov", 'b'}, {"dec", 'b'}
};

// time | number | word | anything else
const std::regex _re_dt_components(R"((\d{1,2}\s*:\s*\d\d(?:\s*:\s*\d\d(?:[.,]\d{1,6})?)?(?!\d))|(\d+)|[a-zA-Z]+|[^\da-zA-Z]+)");

// H:MM[:SS[.ffffff]] -> %H:%M[:%S[.%f]]
void append_time_format(std::string& fmt, const std::ssub_match& m)
{
	static const char time_codes[] = { 'H', 'M', 'S', 'f' };
	size_t next_code = 0;
	bool prev_digit = false;
	for (auto it = m.first; it != m.second; ++it)
	{
		bool digit = std::isdigit((unsigned char)*it) != 0;
		if (!digit)
			fmt += *it;
		else if (!prev_digit)
			fmt += {'%', time_codes[next_code++]};
		prev_digit = digit;
	}
}

// position of a format code in fmt or npos
size_t code_pos(const std::string& fmt, char code)
{
	char pattern[] = { '%', code, '\0' };
	return fmt.find(pattern);
}

bool month_before_day(const std::string& fmt)
{
	size_t m = code_pos(fmt, 'm'), d = code_pos(fmt, 'd');
	return m != std::string::npos && d != std::string::npos && m < d;
}

bool day_before_month(const std::string& fmt)
{
	size_t m = code_pos(fmt, 'm'), d = code_pos(fmt, 'd');
	return m != std::string::npos && d != std::string::npos && d < m;
}

class TDateTime
{
public:
	explicit TDateTime(bool month_first) : m_month_first(month_first) {}

	// Builds every format that reads input as a date, in priority order
	bool infer_dt_format(const std::string& input)
	{
		std::string fmt; // '%_' marks a d/m/y slot to be filled
		std::vector<std::pair<size_t, int>> slots; // position of '_' in fmt, digits in token
		int hour_pos = -1;
		int year_slot = -1; // number of d/m/y slots before an explicit 4-digit year
		bool have_ampm = false, have_month_name = false;

		for (std::sregex_iterator m(input.begin(), input.end(), _re_dt_components); m != std::sregex_iterator(); ++m)
		{
			if ((*m)[2].matched)
			{
				int len = (int)m->length();
				char prev = m->position() > 0 ? input[m->position() - 1] : '\0';
				if ((len == 4 || len == 6) && (prev == '+' || prev == '-') && !fmt.empty() &&
				    !(len == 4 && std::stoi(m->str()) > 1500)) // offset like -0100, not a year
				{
					fmt.back() = '%';
					fmt += 'z';
					continue;
				}
				if (len == 8 && "19000101" <= m->str() && m->str() <= "20991231") // YYYYMMDD
				{
					if (year_slot >= 0)
						return false;
					fmt += "%Y%m";
					year_slot = (int)slots.size();
					have_month_name = true;
					len = 2;
				}
				if (len == 4)
				{
					if (year_slot >= 0)
						return false;
					fmt += "%Y";
					year_slot = (int)slots.size();
				}
				else if (len <= 2)
				{
					fmt += "%_";
					slots.emplace_back(fmt.size() - 1, len);
				}
				else
					return false;
			}
			else if ((*m)[1].matched)
			{
				if (hour_pos >= 0)
					return false;
				hour_pos = (int)fmt.size() + 1;
				append_time_format(fmt, (*m)[1]);
			}
			else
			{
				std::string word = boost::algorithm::to_lower_copy(m->str());
				auto token = _dt_tokens.find(word);
				if (token == _dt_tokens.end())
				{
					for (char c : m->str())
					{
						if (c == '%')
							fmt += '%';
						fmt += c;
					}
				}
				else
				{
					have_ampm |= token->second == 'p';
					have_month_name |= token->second == 'b';
					fmt += {'%', token->second};
				}
			}
		}

		if (have_ampm && hour_pos >= 0)
			fmt[hour_pos] = 'I';
		if (slots.empty())
			return false; // time of day alone is not a date

		const char* orders;
		size_t n_slots;
		if (have_month_name)
		{
			if (year_slot < 0)
				orders = "dy" "yd", n_slots = 2;
			else
				orders = "d", n_slots = 1;
		}
		else if (year_slot < 0)
		{
			orders = m_month_first ? "mdy" "dmy" "ymd" "ydm" "myd" "dym" : "dmy" "mdy" "ymd" "ydm" "myd" "dym";
			n_slots = 3;
		}
		else if (year_slot == 0) // ISO order, year-day-month is not in use
			orders = "md", n_slots = 2;
		else if (!m_month_first && year_slot >= 2)
			orders = "dm" "md", n_slots = 2;
		else
			orders = "md" "dm", n_slots = 2;
		if (slots.size() != n_slots)
			return false;

		double t = 0.0;
		for (const char* order = orders; *order; order += n_slots)
		{
			bool usable = true;
			for (size_t i = 0; i < n_slots && usable; ++i)
			{
				if (order[i] == 'y' && slots[i].second == 1)
					usable = false; // one digit cannot be a year
				else
					fmt[slots[i].first] = order[i];
			}
			if (usable && strptime(input, fmt, t))
			{
				m_formats.push_back(fmt);
				if (t != std::trunc(t))
					m_have_time = true;
			}
		}
		if (!m_formats.empty())
			m_example = input;
		return !m_formats.empty();
	}

	int infer(const CellRaw& cell)
	{
		if (!m_valid)
			return 0;
		return m_valid = std::visit(overloaded{
		[this](const std::string& s) -> bool
		{
			if (m_formats.empty())
				return infer_dt_format(s);
			double t;
			for (auto it = m_formats.begin(); it != m_formats.end();)
			{
				if (!strptime(s, *it, t))
					it = m_formats.erase(it);
				else
				{
					if (t != std::trunc(t))
						m_have_time = true;
					++it;
				}
			}
			return !m_formats.empty();
		},
		[this](const CellRawDate& v) -> bool
		{
			if (v.d != std::trunc(v.d))
				m_have_time = true;
			return true;
		},
		[](auto v) -> bool { return false; },
		}, cell);
	}

	bool create_schema(InferredColumn& col) const
	{
		if (!m_valid)
			return false;
		col.type = m_have_time ? ColumnType::Timestamp : ColumnType::Date;
		if (!m_formats.empty())
			col.format = m_formats.front();
		return true;
	}

	bool ambiguous() const
	{
		return std::any_of(m_formats.begin(), m_formats.end(), month_before_day) &&
		       std::any_of(m_formats.begin(), m_formats.end(), day_before_month);
	}

	bool m_valid = true;
	bool m_month_first;
	bool m_have_time = false;
	std::vector<std::string> m_formats;
	std::string m_example;
};

}

struct ColumnInferrer::Candidates
{
	explicit Candidates(bool month_first) :
		m_month_first(month_first),
		m_types(TBoolean(), TInteger(), TDecimal(), TDateTime(month_first))
	{}

	bool m_month_first;
	bool m_empty = true;
	bool m_saw_typed = false; // some value on its own would not be text
	std::tuple<TBoolean, TInteger, TDecimal, TDateTime> m_types;
};

ColumnInferrer::ColumnInferrer(bool month_first) : d(std::make_unique<Candidates>(month_first)) {}
ColumnInferrer::ColumnInferrer(ColumnInferrer&&) noexcept = default;
ColumnInferrer& ColumnInferrer::operator = (ColumnInferrer&&) noexcept = default;
ColumnInferrer::~ColumnInferrer() = default;

void ColumnInferrer::infer(const CellRaw& cell)
{
	if (cell_empty(cell))
		return;
	d->m_empty = false;
	std::apply([&cell](auto&& ... args) { (args.infer(cell), ...); }, d->m_types);
	if (!d->m_saw_typed)
	{
		const std::string* s = std::get_if<std::string>(&cell);
		d->m_saw_typed = !s || ClassifyValue(*s, d->m_month_first) != ColumnType::String;
	}
}

bool ColumnInferrer::empty() const
{
	return d->m_empty;
}

InferredColumn ColumnInferrer::result(const std::string& column_name) const
{
	InferredColumn col;
	if (d->m_empty)
		return col;
	bool typed = std::apply([&col](auto&& ... args) { return (args.create_schema(col) || ...); }, d->m_types);
	if (!typed)
	{
		col.type = ColumnType::String;
		if (d->m_saw_typed)
			col.warnings.push_back("Column '" + column_name + "' mixes text with numbers, dates or booleans; stored as VARCHAR");
		return col;
	}
	const TDateTime& dt = std::get<TDateTime>(d->m_types);
	if ((col.type == ColumnType::Date || col.type == ColumnType::Timestamp) && dt.ambiguous())
	{
		ParsedDate sample = ParseDateWithWarnings(dt.m_example, d->m_month_first);
		col.warnings.push_back("Column '" + column_name + "' has ambiguous dates, read as " +
			(month_before_day(col.format) ? "month-first (US)" : "day-first (EU)") +
			(sample.warning.empty() ? std::string() : ": " + sample.warning));
	}
	return col;
}

ColumnType ClassifyValue(const std::string& value, bool month_first)
{
	if (value.empty())
		return ColumnType::String;
	ColumnInferrer one(month_first);
	one.d->m_saw_typed = true;
	one.infer(value);
	return one.result(std::string()).type;
}

namespace {

const int64_t MICROS_PER_DAY = 86400000000LL;

duckdb::Value serial_to_date(double serial)
{
	return duckdb::Value::DATE(duckdb::date_t((int32_t)(std::floor(serial) - EXCEL_UNIX_EPOCH)));
}

duckdb::Value serial_to_timestamp(double serial)
{
	return duckdb::Value::TIMESTAMP(duckdb::timestamp_t((int64_t)std::llround((serial - EXCEL_UNIX_EPOCH) * MICROS_PER_DAY)));
}

bool text_to_double(const std::string& s, double& v)
{
	xl::CellValue value;
	if (!xl::parse_number(s.c_str(), value, true))
		return false;
	v = value.value_d;
	return true;
}

bool text_to_serial(const std::string& s, const std::string& fmt, double& v)
{
	return !fmt.empty() && strptime(s, fmt, v);
}

}

bool ConvertCell(const CellRaw& cell, const InferredColumn& column, duckdb::Value& result)
{
	if (cell_empty(cell))
	{
		result = duckdb::Value(ToLogicalType(column.type));
		return true;
	}
	switch (column.type)
	{
	case ColumnType::String:
		result = duckdb::Value(cell_to_string(cell));
		return true;
	case ColumnType::Boolean:
		return std::visit(overloaded{
		[&](const std::string& s) -> bool
		{
			auto it = _bool_dict.find(s);
			if (it == _bool_dict.end())
				return false;
			result = duckdb::Value::BOOLEAN(it->second);
			return true;
		},
		[&](bool v) -> bool { result = duckdb::Value::BOOLEAN(v); return true; },
		[](auto v) -> bool { return false; },
		}, cell);
	case ColumnType::Integer:
	case ColumnType::BigInteger:
	{
		int64_t v;
		bool ok = std::visit(overloaded{
		[&](const std::string& s) -> bool { return parse_int64(s, v); },
		[&](int64_t n) -> bool { v = n; return true; },
		[&](double n) -> bool { if (!is_integer(n)) return false; v = (int64_t)n; return true; },
		[](auto n) -> bool { return false; },
		}, cell);
		if (!ok)
			return false;
		if (column.type == ColumnType::BigInteger)
			result = duckdb::Value::BIGINT(v);
		else if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max())
			result = duckdb::Value::INTEGER((int32_t)v);
		else
			return false;
		return true;
	}
	case ColumnType::Double:
	{
		double v;
		bool ok = std::visit(overloaded{
		[&](const std::string& s) -> bool { return text_to_double(s, v); },
		[&](int64_t n) -> bool { v = (double)n; return true; },
		[&](double n) -> bool { v = n; return true; },
		[](auto n) -> bool { return false; },
		}, cell);
		if (ok)
			result = duckdb::Value::DOUBLE(v);
		return ok;
	}
	case ColumnType::Date:
	case ColumnType::Timestamp:
	{
		double serial;
		bool ok = std::visit(overloaded{
		[&](const std::string& s) -> bool { return text_to_serial(s, column.format, serial); },
		[&](const CellRawDate& v) -> bool { serial = v.d; return true; },
		[](auto v) -> bool { return false; },
		}, cell);
		if (ok)
			result = column.type == ColumnType::Date ? serial_to_date(serial) : serial_to_timestamp(serial);
		return ok;
	}
	}
	return false;
}

static const std::regex _re_excel_serial(R"(\d{5})");

ParsedDate ParseDateWithWarnings(const std::string& text, bool month_first)
{
	ParsedDate res;
	std::string value = text;
	trim(value);
	if (value.empty())
	{
		res.value = duckdb::Value(duckdb::LogicalType::DATE);
		return res;
	}
	if (std::regex_match(value, _re_excel_serial))
	{
		res.value = serial_to_date(std::stod(value));
		return res;
	}

	TDateTime dt(month_first);
	if (!dt.infer_dt_format(value))
	{
		res.value = duckdb::Value(text);
		res.warning = "Could not parse date '" + text + "'; kept as text";
		return res;
	}
	const std::string& fmt = dt.m_formats.front();
	double serial = 0.0;
	strptime(value, fmt, serial);
	res.value = dt.m_have_time ? serial_to_timestamp(serial) : serial_to_date(serial);
	if (dt.ambiguous())
	{
		auto other = std::find_if(dt.m_formats.begin(), dt.m_formats.end(),
			month_before_day(fmt) ? day_before_month : month_before_day);
		double other_serial = 0.0;
		strptime(value, *other, other_serial);
		std::string us = serial_to_string(month_before_day(fmt) ? serial : other_serial, dt.m_have_time);
		std::string eu = serial_to_string(month_before_day(fmt) ? other_serial : serial, dt.m_have_time);
		res.warning = "Date '" + text + "' could be " + us + " (US) or " + eu + " (EU). Using " + (month_first ? "US" : "EU") + " format.";
	}
	return res;
}

}
