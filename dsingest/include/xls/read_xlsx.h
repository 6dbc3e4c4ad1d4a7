#ifndef DSINGEST_READ_XLSX_H
#define DSINGEST_READ_XLSX_H

#include <memory>
#include <string>

#include "xlscommon.h"

namespace dsingest {
namespace xl {

class WorkSheetX
{
public:
	WorkSheetX();
	WorkSheetX(const WorkSheetX&) = delete;
	WorkSheetX& operator = (const WorkSheetX&) = delete;
	WorkSheetX(WorkSheetX&&) noexcept;
	WorkSheetX& operator = (WorkSheetX&&) noexcept;
	~WorkSheetX();
	void close();
	explicit operator bool() const;
	int nrows() const;
	// Advances to the next row, rows missing from the sheet are returned empty
	bool next_row();
	bool next_cell(CellValue& value);
	// 1-based sheet row of the current row
	int row_number() const;
	// the sheet data was truncated or malformed
	bool has_error() const;

	struct Impl;
private:
	friend class WorkBookX;
	explicit WorkSheetX(std::unique_ptr<Impl> ws);
	std::unique_ptr<Impl> d;
};

class WorkBookX
{
public:
	typedef WorkSheetX WorkSheetType;

	WorkBookX();
	WorkBookX(const WorkBookX&) = delete;
	WorkBookX& operator = (const WorkBookX&) = delete;
	WorkBookX(WorkBookX&& other) noexcept;
	WorkBookX& operator = (WorkBookX&& other) noexcept;
	~WorkBookX();
	bool open(const std::string& filename);
	void close();
	explicit operator bool() const;
	size_t sheet_count() const;
	std::string sheet_name(size_t sheet_number) const;
	WorkSheetX sheet(size_t sheet_number);

	struct Impl;
private:
	std::unique_ptr<Impl> d;
};

}
}

#endif
