#ifndef DSINGEST_READ_XLS_H
#define DSINGEST_READ_XLS_H

#include <memory>
#include <string>

#include "xlscommon.h"

namespace dsingest {
namespace xl {

// Legacy BIFF workbooks (.xls), read through libxls
class WorkSheet
{
public:
	WorkSheet();
	WorkSheet(const WorkSheet&) = delete;
	WorkSheet& operator = (const WorkSheet&) = delete;
	WorkSheet(WorkSheet&&) noexcept;
	WorkSheet& operator = (WorkSheet&&) noexcept;
	~WorkSheet();
	void close();
	explicit operator bool() const;
	int nrows() const;
	bool next_row();
	bool next_cell(CellValue& value);
	int row_number() const;
	bool has_error() const { return false; }

	struct Impl;
private:
	friend class WorkBook;
	explicit WorkSheet(std::unique_ptr<Impl> ws);
	std::unique_ptr<Impl> d;
};

class WorkBook
{
public:
	typedef WorkSheet WorkSheetType;

	WorkBook();
	WorkBook(const WorkBook&) = delete;
	WorkBook& operator = (const WorkBook&) = delete;
	WorkBook(WorkBook&& other) noexcept;
	WorkBook& operator = (WorkBook&& other) noexcept;
	~WorkBook();
	bool open(const std::string& filename);
	void close();
	explicit operator bool() const;
	size_t sheet_count() const;
	std::string sheet_name(size_t sheet_number) const;
	WorkSheet sheet(size_t sheet_number);

	struct Impl;
private:
	std::unique_ptr<Impl> d;
};

}
}

#endif
