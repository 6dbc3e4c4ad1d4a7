#include <filesystem>
#include <utility>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>

#include "exception.hpp"
#include "logging.hpp"
#include "table_loader.hpp"
#include "xls/read_xls.h"
#include "xls/read_xlsx.h"
#include "xls_source.h"

namespace dsingest {

namespace {

template<class TWorkBook>
class SheetReader
{
public:
	explicit SheetReader(const std::string& path) : m_path(path) {}

	std::vector<std::string> sheet_names()
	{
		open_wb();
		std::vector<std::string> ret;
		size_t sheet_cnt = m_wb.sheet_count();
		ret.reserve(sheet_cnt);
		for (size_t i = 0; i < sheet_cnt; ++i)
			ret.push_back(m_wb.sheet_name(i));
		return ret;
	}

	// Feeds the selected sheet into the loader, returns the name of the sheet read
	std::string read(const std::string& sheet_name, bool header, TableLoader& loader)
	{
		size_t sheet_number = select_sheet(sheet_name);
		typename TWorkBook::WorkSheetType ws = m_wb.sheet(sheet_number);
		if (!ws)
			throw ValidationException("Cannot read sheet '" + m_wb.sheet_name(sheet_number) + "' of " + m_path,
				"Check that the file is a valid Excel workbook");

		bool header_pending = header;
		RowRaw row;
		while (ws.next_row())
		{
			get_row(ws, row);
			if (header_pending)
			{
				// leading blank rows are not the header
				bool blank = true;
				for (const CellRaw& cell : row)
					blank = blank && cell_empty(cell);
				if (blank)
					continue;
				loader.SetHeader(row);
				header_pending = false;
				continue;
			}
			loader.AddRow(std::move(row), ws.row_number());
		}
		if (ws.has_error())
			throw ValidationException("Sheet '" + m_wb.sheet_name(sheet_number) + "' of " + m_path + " is truncated or malformed",
				"Re-save the workbook in Excel and try again");
		return m_wb.sheet_name(sheet_number);
	}

private:
	void open_wb()
	{
		if (m_wb)
			return;
		if (!m_wb.open(m_path))
			throw ValidationException("Cannot read workbook " + m_path, "Check that the file is a valid, unencrypted Excel workbook");
	}

	size_t select_sheet(const std::string& sheet_name)
	{
		std::vector<std::string> names = sheet_names();
		if (names.empty())
			throw ValidationException("Workbook " + m_path + " has no sheets", "Check that the file is a valid Excel workbook");
		if (sheet_name.empty())
			return 0;
		for (size_t i = 0; i < names.size(); ++i)
			if (names[i] == sheet_name)
				return i;
		throw ValidationException("Sheet '" + sheet_name + "' not found in " + m_path,
			"Available sheets: " + boost::algorithm::join(names, ", "));
	}

	static void get_row(typename TWorkBook::WorkSheetType& ws, RowRaw& row)
	{
		row.clear();
		xl::CellValue value;
		while (ws.next_cell(value))
		{
			switch (value.type)
			{
			case xl::CellType::Empty:
			case xl::CellType::Error:
				row.emplace_back(std::in_place_type<std::string>);
				break;
			case xl::CellType::String:
				row.push_back(std::move(value.value_s));
				break;
			case xl::CellType::Integer:
				row.emplace_back(value.value_i);
				break;
			case xl::CellType::Double:
				row.emplace_back(value.value_d);
				break;
			case xl::CellType::Date:
				row.emplace_back(CellRawDate{value.value_d});
				break;
			case xl::CellType::Bool:
				row.emplace_back(value.value_b);
				break;
			}
		}
	}

	std::string m_path;
	TWorkBook m_wb;
};

enum class WorkbookFormat { Xls, Xlsx };

WorkbookFormat workbook_format(const std::string& path)
{
	std::error_code ec;
	if (!std::filesystem::is_regular_file(path, ec))
		throw NotFoundException("File not found: " + path, "Check the path and that the file is readable");
	std::string ext = boost::algorithm::to_lower_copy(std::filesystem::path(path).extension().string());
	if (ext == ".xls" || ext == ".xlt")
		return WorkbookFormat::Xls;
	if (ext == ".xlsx" || ext == ".xlsm" || ext == ".xltx" || ext == ".xltm")
		return WorkbookFormat::Xlsx;
	throw ValidationException("Unsupported spreadsheet format '" + ext + "'", "Use .xlsx, .xlsm, .xltx, .xltm, .xls or .xlt files");
}

}

SpreadsheetAdapter::SpreadsheetAdapter(const IngestConfig& config, std::string path, std::string sheet, bool header) :
	m_config(config),
	m_path(std::move(path)),
	m_sheet(std::move(sheet)),
	m_header(header)
{
}

std::string SpreadsheetAdapter::source_type() const
{
	return "spreadsheet";
}

std::string SpreadsheetAdapter::label() const
{
	return m_sheet.empty() ? m_path : m_path + "[" + m_sheet + "]";
}

std::vector<std::string> SpreadsheetAdapter::list_sheets(const std::string& path)
{
	if (workbook_format(path) == WorkbookFormat::Xls)
		return SheetReader<xl::WorkBook>(path).sheet_names();
	return SheetReader<xl::WorkBookX>(path).sheet_names();
}

ImportResult SpreadsheetAdapter::import_data(duckdb::Connection& con, const std::string& table)
{
	TableLoader loader(m_config);
	std::string sheet;
	if (workbook_format(m_path) == WorkbookFormat::Xls)
		sheet = SheetReader<xl::WorkBook>(m_path).read(m_sheet, m_header, loader);
	else
		sheet = SheetReader<xl::WorkBookX>(m_path).read(m_sheet, m_header, loader);

	bool empty = !loader.HasRows();
	ImportResult res = loader.Load(con, table, source_type());
	if (empty)
		res.warnings.insert(res.warnings.begin(), "Sheet is empty");
	Log()->info("imported sheet '{}' of {}: {} rows, {} columns", sheet, m_path, res.row_count, res.columns.size());
	return res;
}

}
