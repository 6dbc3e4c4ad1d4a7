#ifndef DSINGEST_CSV_SOURCE_H
#define DSINGEST_CSV_SOURCE_H

#include <string>

#include "config.hpp"
#include "source_adapter.hpp"

namespace dsingest {

struct DelimitedOptions {
	//! single character, "\t" and "tab" are accepted for tab
	std::string delimiter = ",";
	bool header = true;
};

// Validates a user supplied delimiter and returns the single character to use
char ParseDelimiter(const std::string& delimiter);

// CSV, TSV and other delimited text files
class DelimitedFileAdapter : public SourceAdapter
{
public:
	DelimitedFileAdapter(const IngestConfig& config, std::string path, DelimitedOptions options = DelimitedOptions());

	std::string source_type() const override;
	std::string label() const override;
	ImportResult import_data(duckdb::Connection& con, const std::string& table) override;

	// ICU charset name of the file, "UTF-8" or "ASCII" when no conversion is needed
	static std::string detect_charset(const std::string& path);

private:
	IngestConfig m_config;
	std::string m_path;
	DelimitedOptions m_options;
};

}

#endif
