#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <utility>

#include <boost/algorithm/string/predicate.hpp>
#include <unicode/ucnv.h>
#include <unicode/ucsdet.h>

#include "duckdb/common/error_data.hpp"
#include "csv_source.h"
#include "exception.hpp"
#include "logging.hpp"
#include "table_loader.hpp"
#include "utility.h"

using namespace std::literals;

namespace dsingest {

namespace {

struct CUCharsetDetector
{
	CUCharsetDetector(UCharsetDetector* pointer) : m_pointer(pointer) {}
	~CUCharsetDetector() { ucsdet_close(m_pointer); }
	CUCharsetDetector(const CUCharsetDetector&) = delete;
	CUCharsetDetector& operator = (const CUCharsetDetector&) = delete;
	operator UCharsetDetector* () { return m_pointer; }
	UCharsetDetector* m_pointer;
};

struct CUConverter
{
	CUConverter(UConverter* pointer) : m_pointer(pointer) {}
	~CUConverter() { ucnv_close(m_pointer); }
	CUConverter(const CUConverter&) = delete;
	CUConverter& operator = (const CUConverter&) = delete;
	operator UConverter* () { return m_pointer; }
	UConverter* m_pointer;
};

// Scratch file removed when it goes out of scope
class TempFile
{
public:
	TempFile()
	{
		static std::atomic<unsigned> counter{0};
		m_path = std::filesystem::temp_directory_path() /
			("dsingest-" + std::to_string(reinterpret_cast<uintptr_t>(this)) + "-" + std::to_string(++counter) + ".csv");
	}
	~TempFile()
	{
		std::error_code ec;
		std::filesystem::remove(m_path, ec);
	}
	TempFile(const TempFile&) = delete;
	TempFile& operator = (const TempFile&) = delete;
	std::string path() const { return m_path.string(); }

private:
	std::filesystem::path m_path;
};

const size_t SAMPLE_SIZE = 1024 * 1024;
const size_t CNV_BUF_SIZE = 4096;

bool transcode_to_utf8(const std::string& src, const std::string& charset, const std::string& dst)
{
	std::ifstream in(src, std::ios::binary);
	std::ofstream out(dst, std::ios::binary | std::ios::trunc);
	if (!in || !out)
		return false;

	UErrorCode ustatus = U_ZERO_ERROR;
	CUConverter ucnv_from(ucnv_open(charset.c_str(), &ustatus)); if (!U_SUCCESS(ustatus)) return false;
	CUConverter ucnv_to(ucnv_open("UTF-8", &ustatus)); if (!U_SUCCESS(ustatus)) return false;

	char read_buf[CNV_BUF_SIZE];
	char cnv_buf[CNV_BUF_SIZE];
	UChar pivot_buf[CNV_BUF_SIZE];
	UChar* pivot_source = pivot_buf;
	UChar* pivot_target = pivot_buf;
	bool first = true;
	for (;;)
	{
		in.read(read_buf, sizeof(read_buf));
		size_t nread = (size_t)in.gcount();
		bool last = nread < sizeof(read_buf);
		const char* source = read_buf;
		const char* source_end = read_buf + nread;
		if (first)
		{
			std::string_view head(read_buf, nread);
			if ((charset == "UTF-16LE" && startswith("\xFF\xFE"sv)(head)) || (charset == "UTF-16BE" && startswith("\xFE\xFF"sv)(head)))
				source += 2;
			first = false;
		}
		do
		{
			char* target = cnv_buf;
			ustatus = U_ZERO_ERROR;
			ucnv_convertEx(ucnv_to, ucnv_from, &target, cnv_buf + sizeof(cnv_buf), &source, source_end,
				pivot_buf, &pivot_source, &pivot_target, pivot_buf + CNV_BUF_SIZE, false, last, &ustatus);
			out.write(cnv_buf, target - cnv_buf);
		} while (ustatus == U_BUFFER_OVERFLOW_ERROR);
		if (!U_SUCCESS(ustatus))
			return false;
		if (last)
			break;
	}
	return static_cast<bool>(out);
}

}

char ParseDelimiter(const std::string& delimiter)
{
	if (delimiter.empty())
		throw ValidationException("Delimiter must not be empty", "Use ',' for CSV or '\\t' for tab-separated files");
	if (delimiter == "\\t" || boost::algorithm::iequals(delimiter, "tab"))
		return '\t';
	if (delimiter.size() != 1)
		throw ValidationException("Delimiter '" + delimiter + "' must be a single character", "Use ',', ';', '|' or '\\t'");
	char c = delimiter[0];
	if (c == '"' || c == '\'')
		throw ValidationException("Quote characters cannot be used as delimiter", "Use ',', ';', '|' or '\\t'");
	if (c == '\n' || c == '\r')
		throw ValidationException("Line breaks cannot be used as delimiter", "Use ',', ';', '|' or '\\t'");
	return c;
}

DelimitedFileAdapter::DelimitedFileAdapter(const IngestConfig& config, std::string path, DelimitedOptions options) :
	m_config(config),
	m_path(std::move(path)),
	m_options(std::move(options))
{
}

std::string DelimitedFileAdapter::source_type() const
{
	return "delimited-file";
}

std::string DelimitedFileAdapter::label() const
{
	return m_path;
}

std::string DelimitedFileAdapter::detect_charset(const std::string& path)
{
	std::ifstream in(path, std::ios::binary);
	std::string sample(SAMPLE_SIZE, '\0');
	in.read(&sample[0], SAMPLE_SIZE);
	sample.resize((size_t)in.gcount());
	if (sample.empty())
		return "ASCII";

	UErrorCode ustatus = U_ZERO_ERROR;
	CUCharsetDetector ucsd(ucsdet_open(&ustatus)); if (!U_SUCCESS(ustatus)) return "UTF-8";
	ucsdet_setText(ucsd, sample.data(), (int32_t)sample.size(), &ustatus); if (!U_SUCCESS(ustatus)) return "UTF-8";
	const UCharsetMatch* ucm = ucsdet_detect(ucsd, &ustatus); if (!U_SUCCESS(ustatus) || !ucm) return "UTF-8";
	int32_t uconfidence = ucsdet_getConfidence(ucm, &ustatus); if (!U_SUCCESS(ustatus)) return "UTF-8";
	if (uconfidence < 10)
		return "UTF-8";
	std::string charset = ucsdet_getName(ucm, &ustatus);
	if (!U_SUCCESS(ustatus))
		return "UTF-8";
	if (startswith("ISO-")(charset) && std::all_of(sample.begin(), sample.end(), [](char c) { return (unsigned char)c < 128; }))
		return "ASCII";
	return charset;
}

ImportResult DelimitedFileAdapter::import_data(duckdb::Connection& con, const std::string& table)
{
	char delimiter = ParseDelimiter(m_options.delimiter);
	std::error_code ec;
	if (!std::filesystem::is_regular_file(m_path, ec))
		throw NotFoundException("File not found: " + m_path, "Check the path and that the file is readable");

	std::vector<std::string> warnings;
	TableLoader loader(m_config);
	std::unique_ptr<TempFile> converted;
	std::string read_path = m_path;

	if (std::filesystem::file_size(m_path, ec) == 0 || ec)
		warnings.push_back("File is empty");
	else
	{
		std::string charset = detect_charset(m_path);
		if (charset != "UTF-8" && charset != "ASCII")
		{
			converted = std::make_unique<TempFile>();
			if (!transcode_to_utf8(m_path, charset, converted->path()))
				throw ValidationException("Could not convert " + m_path + " from " + charset + " to UTF-8", "Save the file with UTF-8 encoding");
			read_path = converted->path();
			warnings.push_back("File encoding detected as " + charset + "; converted to UTF-8");
		}

		std::string sql = "SELECT * FROM read_csv(" + QuoteLiteral(read_path) +
			", delim = " + QuoteLiteral(std::string(1, delimiter)) +
			", header = false, all_varchar = true, null_padding = true, sample_size = -1)";
		const std::string hint = "Check that the file is delimited by '" + std::string(1, delimiter) + "' and its quotes are balanced";
		auto result = con.SendQuery(sql);
		if (result->HasError())
			throw ValidationException("Could not read " + m_path + ": " + result->GetError(), hint);

		int64_t source_row = 0;
		bool header_pending = m_options.header;
		try
		{
			while (auto chunk = result->Fetch())
			{
				for (duckdb::idx_t r = 0; r < chunk->size(); ++r)
				{
					RowRaw row;
					row.reserve(chunk->ColumnCount());
					for (duckdb::idx_t c = 0; c < chunk->ColumnCount(); ++c)
					{
						duckdb::Value v = chunk->GetValue(c, r);
						row.emplace_back(v.IsNull() ? std::string() : v.ToString());
					}
					if (header_pending)
					{
						loader.SetHeader(row);
						header_pending = false;
						continue;
					}
					loader.AddRow(std::move(row), ++source_row);
				}
			}
		}
		catch (std::exception& ex)
		{
			throw ValidationException("Could not read " + m_path + ": " + duckdb::ErrorData(ex).Message(), hint);
		}
		if (result->HasError())
			throw ValidationException("Could not read " + m_path + ": " + result->GetError(), hint);
	}

	ImportResult res = loader.Load(con, table, source_type());
	res.warnings.insert(res.warnings.begin(), warnings.begin(), warnings.end());
	Log()->info("imported delimited file {}: {} rows, {} columns", m_path, res.row_count, res.columns.size());
	return res;
}

}
