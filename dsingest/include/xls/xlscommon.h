#ifndef DSINGEST_XLSCOMMON_H
#define DSINGEST_XLSCOMMON_H

#include <cstdint>
#include <string>

namespace dsingest {
namespace xl {

enum class CellType { Empty, String, Integer, Double, Date, Bool, Error };

struct CellValue
{
	CellType type = CellType::Empty;
	std::string value_s;
	int64_t value_i = 0;
	double value_d = 0.0; // Excel serial number for Date
	bool value_b = false;

	void set_empty() { type = CellType::Empty; }
	void set_error() { type = CellType::Error; }
	void set_string(std::string v) { type = CellType::String; value_s = std::move(v); }
	void set_integer(int64_t v) { type = CellType::Integer; value_i = v; }
	void set_double(double v) { type = CellType::Double; value_d = v; }
	void set_date(double v) { type = CellType::Date; value_d = v; }
	void set_bool(bool v) { type = CellType::Bool; value_b = v; }
};

// True when an Excel number format code renders dates or times
bool is_date_format(const char* fmt);

// Built-in number format ids that render dates or times
bool is_builtin_date_format(int id);

// Parses a numeric cell text. Integers without fraction or exponent become Integer
// unless is_date is set; returns false if trailing characters remain.
bool parse_number(const char* s, CellValue& value, bool is_date);

}
}

#endif
