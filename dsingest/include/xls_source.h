#ifndef DSINGEST_XLS_SOURCE_H
#define DSINGEST_XLS_SOURCE_H

#include <string>
#include <vector>

#include "config.hpp"
#include "source_adapter.hpp"

namespace dsingest {

// Excel workbooks: .xlsx/.xlsm/.xltx/.xltm through minizip and expat, .xls/.xlt through libxls
class SpreadsheetAdapter : public SourceAdapter
{
public:
	// An empty sheet name selects the first sheet
	SpreadsheetAdapter(const IngestConfig& config, std::string path, std::string sheet = std::string(), bool header = true);

	std::string source_type() const override;
	std::string label() const override;
	ImportResult import_data(duckdb::Connection& con, const std::string& table) override;

	static std::vector<std::string> list_sheets(const std::string& path);

private:
	IngestConfig m_config;
	std::string m_path;
	std::string m_sheet;
	bool m_header;
};

}

#endif
