#include <cstring>
#include <utility>

#include <xls.h>

#include "utility.h"
#include "xls/read_xls.h"

namespace dsingest {
namespace xl {

struct WorkBook::Impl
{
	explicit Impl(xls::xlsWorkBook* wb) : m_wb(wb) {}
	~Impl() { xls::xls_close_WB(m_wb); }
	Impl(const Impl&) = delete;
	Impl& operator = (const Impl&) = delete;

	bool is_date_xf(unsigned xf) const
	{
		return xf < m_wb->xfs.count && is_builtin_date_format(m_wb->xfs.xf[xf].format);
	}

	xls::xlsWorkBook* m_wb;
};

struct WorkSheet::Impl
{
	Impl(WorkBook::Impl* wb, xls::xlsWorkSheet* ws) : m_wb(wb), m_ws(ws) {}
	~Impl() { xls::xls_close_WS(m_ws); }
	Impl(const Impl&) = delete;
	Impl& operator = (const Impl&) = delete;

	void read_cell(const xls::xlsCell& cell, CellValue& value) const;

	WorkBook::Impl* m_wb;
	xls::xlsWorkSheet* m_ws;
	int m_row = -1;
	int m_col = -1;
};

void WorkSheet::Impl::read_cell(const xls::xlsCell& cell, CellValue& value) const
{
	bool numeric = false;
	switch (cell.id)
	{
	case XLS_RECORD_RK:
	case XLS_RECORD_MULRK:
	case XLS_RECORD_NUMBER:
		numeric = true;
		break;
	case XLS_RECORD_BOOLERR:
		if (cell.str && std::strcmp(cell.str, "error") == 0)
			value.set_error();
		else
			value.set_bool(cell.d == 1.0);
		break;
	case XLS_RECORD_FORMULA:
	case XLS_RECORD_FORMULA_ALT:
		// l == 0: numeric result in d, otherwise str holds the result text or its kind
		if (cell.l == 0)
			numeric = true;
		else if (cell.str && std::strcmp(cell.str, "bool") == 0)
			value.set_bool(cell.d == 1.0);
		else if (cell.str && std::strcmp(cell.str, "error") == 0)
			value.set_error();
		else if (cell.str)
			value.set_string(cell.str);
		else
			value.set_empty();
		break;
	case XLS_RECORD_BLANK:
	case XLS_RECORD_MULBLANK:
		value.set_empty();
		break;
	default:
		if (cell.str && *cell.str)
			value.set_string(cell.str);
		else
			value.set_empty();
		break;
	}
	if (!numeric)
		return;
	if (m_wb->is_date_xf(cell.xf))
		value.set_date(cell.d + (m_wb->m_wb->is1904 ? 1462 : 0));
	else if (is_integer(cell.d))
		value.set_integer((int64_t)cell.d);
	else
		value.set_double(cell.d);
}

WorkSheet::WorkSheet() = default;
WorkSheet::WorkSheet(WorkSheet&&) noexcept = default;
WorkSheet& WorkSheet::operator = (WorkSheet&&) noexcept = default;
WorkSheet::~WorkSheet() = default;
WorkSheet::WorkSheet(std::unique_ptr<Impl> ws) : d(std::move(ws)) {}

void WorkSheet::close()
{
	d.reset();
}

WorkSheet::operator bool() const
{
	return static_cast<bool>(d);
}

int WorkSheet::nrows() const
{
	return d && d->m_ws->rows.row ? (int)d->m_ws->rows.lastrow + 1 : -1;
}

int WorkSheet::row_number() const
{
	return d ? d->m_row + 1 : 0;
}

bool WorkSheet::next_row()
{
	if (!d || !d->m_ws->rows.row || d->m_row >= (int)d->m_ws->rows.lastrow)
		return false;
	++d->m_row;
	d->m_col = -1;
	return true;
}

bool WorkSheet::next_cell(CellValue& value)
{
	if (!d || d->m_row < 0 || !d->m_ws->rows.row)
		return false;
	const auto& row = d->m_ws->rows.row[d->m_row];
	if (d->m_col + 1 > (int)d->m_ws->rows.lastcol || (unsigned)(d->m_col + 1) >= row.cells.count)
		return false;
	++d->m_col;
	d->read_cell(row.cells.cell[d->m_col], value);
	return true;
}

WorkBook::WorkBook() = default;
WorkBook::WorkBook(WorkBook&&) noexcept = default;
WorkBook& WorkBook::operator = (WorkBook&&) noexcept = default;
WorkBook::~WorkBook() = default;

bool WorkBook::open(const std::string& filename)
{
	d.reset();
	xls::xls_error_t error = xls::LIBXLS_OK;
	xls::xlsWorkBook* wb = xls::xls_open_file(filename.c_str(), "UTF-8", &error);
	if (!wb)
		return false;
	d = std::make_unique<Impl>(wb);
	return true;
}

void WorkBook::close()
{
	d.reset();
}

WorkBook::operator bool() const
{
	return static_cast<bool>(d);
}

size_t WorkBook::sheet_count() const
{
	return d ? d->m_wb->sheets.count : 0;
}

std::string WorkBook::sheet_name(size_t sheet_number) const
{
	if (sheet_number >= sheet_count())
		return std::string();
	const char* name = d->m_wb->sheets.sheet[sheet_number].name;
	return name ? name : std::string();
}

WorkSheet WorkBook::sheet(size_t sheet_number)
{
	if (sheet_number >= sheet_count())
		return WorkSheet();
	xls::xlsWorkSheet* ws = xls::xls_getWorkSheet(d->m_wb, (int)sheet_number);
	if (!ws)
		return WorkSheet();
	auto impl = std::make_unique<WorkSheet::Impl>(d.get(), ws);
	if (xls::xls_parseWorkSheet(ws) != xls::LIBXLS_OK)
		return WorkSheet();
	return WorkSheet(std::move(impl));
}

}
}
