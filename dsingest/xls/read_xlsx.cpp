#include <cstdlib>
#include <cstring>
#include <deque>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <expat.h>
#include <minizip/unzip.h>

#include "xls/read_xlsx.h"

namespace dsingest {
namespace xl {

namespace {

class ZipEntry
{
public:
	ZipEntry(unzFile zip, const std::string& path) : m_zip(zip)
	{
		m_open = unzLocateFile(m_zip, path.c_str(), 0) == UNZ_OK && unzOpenCurrentFile(m_zip) == UNZ_OK;
	}
	~ZipEntry()
	{
		if (m_open)
			unzCloseCurrentFile(m_zip);
	}
	ZipEntry(const ZipEntry&) = delete;
	ZipEntry& operator = (const ZipEntry&) = delete;

	explicit operator bool() const { return m_open; }
	// bytes read, 0 at end of entry, negative on error
	int read(char* buf, unsigned size) { return unzReadCurrentFile(m_zip, buf, size); }

private:
	unzFile m_zip;
	bool m_open;
};

const unsigned ZIP_CHUNK_SIZE = 64 * 1024;

template<class Parser>
struct BaseXMLParser
{
	using ParserType = Parser;

	BaseXMLParser() : m_xmlparser(XML_ParserCreate(nullptr))
	{
		if (m_xmlparser)
		{
			XML_SetUserData(m_xmlparser, static_cast<Parser*>(this));
			XML_SetElementHandler(m_xmlparser, start, end);
		}
	}
	~BaseXMLParser()
	{
		if (m_xmlparser)
			XML_ParserFree(m_xmlparser);
	}
	BaseXMLParser(const BaseXMLParser&) = delete;
	BaseXMLParser& operator = (const BaseXMLParser&) = delete;

	bool feed(const char* data, int len, bool final)
	{
		return m_xmlparser && XML_Parse(m_xmlparser, data, len, final) != XML_STATUS_ERROR;
	}

	// Parses a whole zip entry, a missing entry counts as failure
	bool parse(unzFile zip, const std::string& path)
	{
		ZipEntry entry(zip, path);
		if (!entry)
			return false;
		std::vector<char> buf(ZIP_CHUNK_SIZE);
		int n;
		while ((n = entry.read(buf.data(), ZIP_CHUNK_SIZE)) > 0)
			if (!feed(buf.data(), n, false))
				return false;
		return n == 0 && feed(nullptr, 0, true);
	}

	static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
	{
		Parser::root::check(userdata, name, atts);
	}

	static constexpr XML_EndElementHandler end = nullptr;
	XML_Parser m_xmlparser;
};

// Element scope: check() switches expat to T's handlers on <tag_name>, end() switches
// back to Parent's on </tag_name>
template<class T, class Parent>
struct Tag
{
	using ParserType = typename Parent::ParserType;

	static ParserType* self(void* userdata) { return static_cast<ParserType*>(userdata); }

	static bool check(void* userdata, const XML_Char* name, const XML_Char** atts)
	{
		if (std::strcmp(name, T::tag_name) != 0)
			return false;
		XML_SetElementHandler(self(userdata)->m_xmlparser, T::start, T::end);
		return true;
	}

	static void XMLCALL end(void* userdata, const XML_Char* name)
	{
		if (std::strcmp(name, T::tag_name) == 0)
			XML_SetElementHandler(self(userdata)->m_xmlparser, Parent::start, Parent::end);
	}

	static const XML_Char* attr_str(const XML_Char** atts, const XML_Char* name)
	{
		for (; atts && *atts; atts += 2)
			if (std::strcmp(*atts, name) == 0)
				return atts[1];
		return nullptr;
	}

	static bool attr_int(const XML_Char** atts, const XML_Char* name, int& value)
	{
		const XML_Char* s = attr_str(atts, name);
		if (!s)
			return false;
		value = std::atoi(s);
		return true;
	}

	static bool attr_bool(const XML_Char** atts, const XML_Char* name, bool& value)
	{
		const XML_Char* s = attr_str(atts, name);
		if (!s)
			return false;
		value = std::strcmp(s, "1") == 0 || std::strcmp(s, "true") == 0 || std::strcmp(s, "on") == 0;
		return true;
	}
};

bool ends_with(const char* s, const char* suffix)
{
	size_t ls = std::strlen(s), lx = std::strlen(suffix);
	return ls >= lx && std::strcmp(s + ls - lx, suffix) == 0;
}

// "xl/" + "worksheets/sheet1.xml", absolute targets start with '/'
std::string resolve_target(const std::string& base_dir, const std::string& target)
{
	if (!target.empty() && target[0] == '/')
		return target.substr(1);
	std::string res = base_dir;
	size_t pos = 0;
	while (target.compare(pos, 3, "../") == 0)
	{
		size_t cut = res.find_last_of('/', res.size() >= 2 ? res.size() - 2 : 0);
		res = cut == std::string::npos ? std::string() : res.substr(0, cut + 1);
		pos += 3;
	}
	return res + target.substr(pos);
}

std::string dir_of(const std::string& path)
{
	size_t slash = path.rfind('/');
	return slash == std::string::npos ? std::string() : path.substr(0, slash + 1);
}

std::string rels_of(const std::string& path)
{
	size_t slash = path.rfind('/');
	std::string dir = slash == std::string::npos ? std::string() : path.substr(0, slash + 1);
	return dir + "_rels/" + path.substr(slash == std::string::npos ? 0 : slash + 1) + ".rels";
}

struct Relationship
{
	std::string type;
	std::string target;
};

struct RelsParser : BaseXMLParser<RelsParser>
{
	struct root : Tag<root, RelsParser>
	{
		static constexpr const char* tag_name = "Relationships";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			const XML_Char *id, *type, *target;
			if (std::strcmp(name, "Relationship") == 0 && (id = attr_str(atts, "Id")) && (type = attr_str(atts, "Type")) && (target = attr_str(atts, "Target")))
				self(userdata)->m_rels[id] = Relationship { type, target };
		}
	};

	// first target whose type URI ends with suffix
	std::string find_type(const char* suffix) const
	{
		for (const auto& rel : m_rels)
			if (ends_with(rel.second.type.c_str(), suffix))
				return rel.second.target;
		return std::string();
	}

	std::unordered_map<std::string, Relationship> m_rels;
};

struct WBParser : BaseXMLParser<WBParser>
{
	struct root : Tag<root, WBParser>
	{
		static constexpr const char* tag_name = "workbook";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			if (!sheets::check(userdata, name, atts) && std::strcmp(name, "workbookPr") == 0)
			{
				bool is1904;
				if (attr_bool(atts, "date1904", is1904) && is1904)
					self(userdata)->m_date1904 = true;
			}
		}
	};

	struct sheets : Tag<sheets, root>
	{
		static constexpr const char* tag_name = "sheets";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			const XML_Char *sheet_name, *rel_id;
			if (std::strcmp(name, "sheet") == 0 && (sheet_name = attr_str(atts, "name")) && (rel_id = attr_str(atts, "r:id")))
				self(userdata)->m_sheets.emplace_back(sheet_name, rel_id);
		}
	};

	std::vector<std::pair<std::string, std::string>> m_sheets; // name, relationship id
	bool m_date1904 = false;
};

struct StylesParser : BaseXMLParser<StylesParser>
{
	explicit StylesParser(std::vector<bool>& date_styles) : m_date_styles(date_styles) {}

	struct root : Tag<root, StylesParser>
	{
		static constexpr const char* tag_name = "styleSheet";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			numFmts::check(userdata, name, atts) || cellXfs::check(userdata, name, atts);
		}
	};

	struct numFmts : Tag<numFmts, root>
	{
		static constexpr const char* tag_name = "numFmts";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			int id;
			const XML_Char* code;
			if (std::strcmp(name, "numFmt") == 0 && attr_int(atts, "numFmtId", id) && (code = attr_str(atts, "formatCode")) && is_date_format(code))
				self(userdata)->m_custom_date_ids.insert(id);
		}
	};

	struct cellXfs : Tag<cellXfs, root>
	{
		static constexpr const char* tag_name = "cellXfs";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			ParserType* th = self(userdata);
			int id;
			if (std::strcmp(name, "xf") == 0)
				th->m_date_styles.push_back(attr_int(atts, "numFmtId", id) &&
					((id >= 14 && id <= 22) || (id >= 45 && id <= 47) || th->m_custom_date_ids.count(id) > 0));
		}
	};

	std::vector<bool>& m_date_styles;
	std::unordered_set<int> m_custom_date_ids;
};

struct SSParser : BaseXMLParser<SSParser>
{
	explicit SSParser(std::vector<std::string>& strings) : m_strings(strings) {}

	struct root : Tag<root, SSParser>
	{
		static constexpr const char* tag_name = "sst";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			if (si::check(userdata, name, atts))
				self(userdata)->m_strings.emplace_back();
		}
	};

	// text of <t> elements, directly or inside rich text runs; phonetic <rPh> runs are skipped
	struct si : Tag<si, root>
	{
		static constexpr const char* tag_name = "si";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			ParserType* th = self(userdata);
			if (std::strcmp(name, "rPh") == 0)
				++th->m_skip;
			else if (std::strcmp(name, "t") == 0 && th->m_skip == 0)
				XML_SetCharacterDataHandler(th->m_xmlparser, content);
		}

		static void XMLCALL end(void* userdata, const XML_Char* name)
		{
			ParserType* th = self(userdata);
			if (std::strcmp(name, "rPh") == 0)
				--th->m_skip;
			else if (std::strcmp(name, "t") == 0)
				XML_SetCharacterDataHandler(th->m_xmlparser, nullptr);
			else
				Tag<si, root>::end(userdata, name);
		}

		static void XMLCALL content(void* userdata, const XML_Char* buf, int len)
		{
			self(userdata)->m_strings.back().append(buf, len);
		}
	};

	std::vector<std::string>& m_strings;
	int m_skip = 0;
};

// "BC12" -> column 55
int ref_column(const char* ref)
{
	int col = 0;
	for (; *ref >= 'A' && *ref <= 'Z'; ++ref)
		col = col * 26 + (*ref - 'A' + 1);
	return col;
}

int ref_row(const char* ref)
{
	while (*ref >= 'A' && *ref <= 'Z')
		++ref;
	return std::atoi(ref);
}

}

struct SheetRow
{
	int number = 0;
	std::vector<std::pair<int, CellValue>> cells; // 1-based column, value
};

// Streams sheet XML; completed rows are queued for next_row()
struct SheetParser : BaseXMLParser<SheetParser>
{
	struct root : Tag<root, SheetParser>
	{
		static constexpr const char* tag_name = "worksheet";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			const XML_Char* ref;
			if (!sheetData::check(userdata, name, atts) && std::strcmp(name, "dimension") == 0 && (ref = attr_str(atts, "ref")))
			{
				const char* last = std::strchr(ref, ':');
				self(userdata)->m_nrows = ref_row(last ? last + 1 : ref);
			}
		}
	};

	struct sheetData : Tag<sheetData, root>
	{
		static constexpr const char* tag_name = "sheetData";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			if (row::check(userdata, name, atts))
			{
				ParserType* th = self(userdata);
				int number;
				th->m_row.number = attr_int(atts, "r", number) && number > 0 ? number : th->m_row.number + 1;
				th->m_row.cells.clear();
			}
		}
	};

	struct row : Tag<row, sheetData>
	{
		static constexpr const char* tag_name = "row";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			if (!c::check(userdata, name, atts))
				return;
			ParserType* th = self(userdata);
			const XML_Char* s = attr_str(atts, "r");
			int col = s ? ref_column(s) : 0;
			if (col <= 0)
				col = th->m_row.cells.empty() ? 1 : th->m_row.cells.back().first + 1;
			th->m_col = col;
			s = attr_str(atts, "t");
			th->m_cell_type = s ? s : "n";
			if (!attr_int(atts, "s", th->m_cell_style))
				th->m_cell_style = -1;
			th->m_text.clear();
		}

		static void XMLCALL end(void* userdata, const XML_Char* name)
		{
			if (std::strcmp(name, tag_name) != 0)
				return;
			ParserType* th = self(userdata);
			th->m_rows.push_back(std::move(th->m_row));
			th->m_row.number = th->m_rows.back().number;
			th->m_row.cells.clear();
			Tag<row, sheetData>::end(userdata, name);
		}
	};

	struct c : Tag<c, row>
	{
		static constexpr const char* tag_name = "c";
		static void XMLCALL start(void* userdata, const XML_Char* name, const XML_Char** atts)
		{
			ParserType* th = self(userdata);
			if (std::strcmp(name, "rPh") == 0 || std::strcmp(name, "extLst") == 0)
				++th->m_skip;
			else if ((std::strcmp(name, "v") == 0 || std::strcmp(name, "t") == 0) && th->m_skip == 0)
				XML_SetCharacterDataHandler(th->m_xmlparser, content);
		}

		static void XMLCALL end(void* userdata, const XML_Char* name)
		{
			ParserType* th = self(userdata);
			if (std::strcmp(name, "rPh") == 0 || std::strcmp(name, "extLst") == 0)
				--th->m_skip;
			else if (std::strcmp(name, "v") == 0 || std::strcmp(name, "t") == 0)
				XML_SetCharacterDataHandler(th->m_xmlparser, nullptr);
			else if (std::strcmp(name, tag_name) == 0)
			{
				th->finish_cell();
				Tag<c, row>::end(userdata, name);
			}
		}

		static void XMLCALL content(void* userdata, const XML_Char* buf, int len)
		{
			self(userdata)->m_text.append(buf, len);
		}
	};

	void finish_cell()
	{
		CellValue value;
		if (m_cell_type == "s")
		{
			size_t index = std::strtoul(m_text.c_str(), nullptr, 10);
			if (!m_text.empty() && index < m_sharedstrings->size())
				value.set_string((*m_sharedstrings)[index]);
		}
		else if (m_cell_type == "b")
		{
			if (!m_text.empty())
				value.set_bool(m_text[0] != '0');
		}
		else if (m_cell_type == "e")
			value.set_error();
		else if (m_cell_type == "n")
		{
			bool is_date = m_cell_style >= 0 && (size_t)m_cell_style < m_date_styles->size() && (*m_date_styles)[m_cell_style];
			if (!m_text.empty() && parse_number(m_text.c_str(), value, is_date) && is_date)
				value.value_d += m_date_offset;
			else if (!m_text.empty() && value.type == CellType::Empty)
				value.set_string(m_text);
		}
		else if (!m_text.empty()) // str, inlineStr, d
			value.set_string(std::move(m_text));
		if (value.type != CellType::Empty)
			m_row.cells.emplace_back(m_col, std::move(value));
	}

	const std::vector<std::string>* m_sharedstrings = nullptr;
	const std::vector<bool>* m_date_styles = nullptr;
	int m_date_offset = 0;

	std::deque<SheetRow> m_rows;
	SheetRow m_row;
	int m_col = 0;
	std::string m_cell_type;
	int m_cell_style = -1;
	std::string m_text;
	int m_skip = 0;
	int m_nrows = -1;
};

struct WorkBookX::Impl
{
	explicit Impl(unzFile zip) : m_zip(zip) {}
	~Impl() { unzClose(m_zip); }
	bool read_workbook();

	unzFile m_zip;
	std::string m_workbook_path;
	std::vector<std::string> m_sheet_names;
	std::vector<std::string> m_sheet_paths;
	std::string m_sharedstrings_path;
	std::string m_styles_path;
	int m_date_offset = 0;
};

bool WorkBookX::Impl::read_workbook()
{
	RelsParser package;
	if (!package.parse(m_zip, "_rels/.rels"))
		return false;
	m_workbook_path = resolve_target("", package.find_type("/officeDocument"));
	if (m_workbook_path.empty())
		return false;

	WBParser wb;
	if (!wb.parse(m_zip, m_workbook_path))
		return false;
	if (wb.m_date1904)
		m_date_offset = 1462;

	RelsParser rels;
	if (!rels.parse(m_zip, rels_of(m_workbook_path)))
		return false;
	std::string base = dir_of(m_workbook_path);
	for (const auto& sheet : wb.m_sheets)
	{
		auto rel = rels.m_rels.find(sheet.second);
		if (rel == rels.m_rels.end())
			continue;
		m_sheet_names.push_back(sheet.first);
		m_sheet_paths.push_back(resolve_target(base, rel->second.target));
	}
	std::string target = rels.find_type("/sharedStrings");
	if (!target.empty())
		m_sharedstrings_path = resolve_target(base, target);
	target = rels.find_type("/styles");
	if (!target.empty())
		m_styles_path = resolve_target(base, target);
	return true;
}

struct WorkSheetX::Impl
{
	bool feed_more();

	std::unique_ptr<ZipEntry> m_entry;
	std::vector<std::string> m_sharedstrings;
	std::vector<bool> m_date_styles;
	SheetParser m_parser;
	bool m_eof = false;
	bool m_error = false;

	SheetRow m_current;
	int m_expected_row = 0;
	size_t m_next_cell = 0;
	int m_next_col = 1;
};

bool WorkSheetX::Impl::feed_more()
{
	if (m_eof)
		return false;
	char buf[ZIP_CHUNK_SIZE];
	int n = m_entry->read(buf, sizeof(buf));
	if (n == 0)
	{
		m_eof = true;
		m_error = !m_parser.feed(nullptr, 0, true);
		return !m_error;
	}
	if (n < 0 || !m_parser.feed(buf, n, false))
	{
		m_eof = m_error = true;
		return false;
	}
	return true;
}

WorkSheetX::WorkSheetX() = default;
WorkSheetX::WorkSheetX(WorkSheetX&&) noexcept = default;
WorkSheetX& WorkSheetX::operator = (WorkSheetX&&) noexcept = default;
WorkSheetX::~WorkSheetX() = default;
WorkSheetX::WorkSheetX(std::unique_ptr<Impl> ws) : d(std::move(ws)) {}

void WorkSheetX::close()
{
	d.reset();
}

WorkSheetX::operator bool() const
{
	return static_cast<bool>(d);
}

int WorkSheetX::nrows() const
{
	return d ? d->m_parser.m_nrows : -1;
}

bool WorkSheetX::has_error() const
{
	return d && d->m_error;
}

int WorkSheetX::row_number() const
{
	return d ? d->m_expected_row : 0;
}

bool WorkSheetX::next_row()
{
	if (!d)
		return false;
	while (d->m_parser.m_rows.empty() && d->feed_more());
	++d->m_expected_row;
	d->m_next_cell = 0;
	d->m_next_col = 1;
	if (!d->m_parser.m_rows.empty() && d->m_parser.m_rows.front().number <= d->m_expected_row)
	{
		d->m_current = std::move(d->m_parser.m_rows.front());
		d->m_parser.m_rows.pop_front();
		d->m_expected_row = d->m_current.number;
		return true;
	}
	d->m_current.cells.clear(); // gap in row numbers
	return !d->m_parser.m_rows.empty();
}

bool WorkSheetX::next_cell(CellValue& value)
{
	if (!d || d->m_next_cell >= d->m_current.cells.size())
		return false;
	auto& cell = d->m_current.cells[d->m_next_cell];
	if (cell.first > d->m_next_col)
		value.set_empty();
	else
	{
		value = std::move(cell.second);
		++d->m_next_cell;
	}
	++d->m_next_col;
	return true;
}

WorkBookX::WorkBookX() = default;
WorkBookX::WorkBookX(WorkBookX&&) noexcept = default;
WorkBookX& WorkBookX::operator = (WorkBookX&&) noexcept = default;
WorkBookX::~WorkBookX() = default;

bool WorkBookX::open(const std::string& filename)
{
	d.reset();
	unzFile zip = unzOpen64(filename.c_str());
	if (!zip)
		return false;
	auto impl = std::make_unique<Impl>(zip);
	if (!impl->read_workbook())
		return false;
	d = std::move(impl);
	return true;
}

void WorkBookX::close()
{
	d.reset();
}

WorkBookX::operator bool() const
{
	return static_cast<bool>(d);
}

size_t WorkBookX::sheet_count() const
{
	return d ? d->m_sheet_names.size() : 0;
}

std::string WorkBookX::sheet_name(size_t sheet_number) const
{
	return sheet_number < sheet_count() ? d->m_sheet_names[sheet_number] : std::string();
}

WorkSheetX WorkBookX::sheet(size_t sheet_number)
{
	if (sheet_number >= sheet_count())
		return WorkSheetX();
	auto ws = std::make_unique<WorkSheetX::Impl>();
	if (!d->m_sharedstrings_path.empty() && !SSParser(ws->m_sharedstrings).parse(d->m_zip, d->m_sharedstrings_path))
		return WorkSheetX();
	if (!d->m_styles_path.empty() && !StylesParser(ws->m_date_styles).parse(d->m_zip, d->m_styles_path))
		return WorkSheetX();
	ws->m_parser.m_sharedstrings = &ws->m_sharedstrings;
	ws->m_parser.m_date_styles = &ws->m_date_styles;
	ws->m_parser.m_date_offset = d->m_date_offset;
	ws->m_entry = std::make_unique<ZipEntry>(d->m_zip, d->m_sheet_paths[sheet_number]);
	if (!*ws->m_entry || !ws->m_parser.m_xmlparser)
		return WorkSheetX();
	return WorkSheetX(std::move(ws));
}

}
}
