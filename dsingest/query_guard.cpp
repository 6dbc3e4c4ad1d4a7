#include "query_guard.hpp"

#include <regex>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/unordered_set.hpp>

#include "duckdb/common/error_data.hpp"
#include "duckdb/parser/expression/subquery_expression.hpp"
#include "duckdb/parser/parsed_expression_iterator.hpp"
#include "duckdb/parser/parser.hpp"
#include "duckdb/parser/query_node/cte_node.hpp"
#include "duckdb/parser/query_node/recursive_cte_node.hpp"
#include "duckdb/parser/query_node/select_node.hpp"
#include "duckdb/parser/query_node/set_operation_node.hpp"
#include "duckdb/parser/result_modifier.hpp"
#include "duckdb/parser/statement/select_statement.hpp"
#include "duckdb/parser/tableref/basetableref.hpp"
#include "duckdb/parser/tableref/expressionlistref.hpp"
#include "duckdb/parser/tableref/joinref.hpp"
#include "duckdb/parser/tableref/pivotref.hpp"
#include "duckdb/parser/tableref/subqueryref.hpp"
#include "exception.hpp"
#include "logging.hpp"
#include "session.hpp"

namespace dsingest {

static const std::regex _re_denied_verbs(
    R"(\b(INSERT|UPDATE|DELETE|DROP|ALTER|CREATE|TRUNCATE|ATTACH|DETACH|COPY|INSTALL|LOAD|PRAGMA|SET|EXPORT|IMPORT|CALL)\b)",
    std::regex::icase);
static const std::regex _re_file_functions(
    R"(\b(read_csv\w*|read_parquet|parquet_scan|read_json\w*|read_ndjson\w*|read_text|read_blob|glob|query|query_table)\s*\()",
    std::regex::icase);

std::string StripStringLiterals(const std::string &sql) {
	std::string result = sql;
	bool in_literal = false;
	for (size_t i = 0; i < result.size(); ++i) {
		if (result[i] != '\'') {
			if (in_literal) {
				result[i] = ' ';
			}
			continue;
		}
		if (in_literal && i + 1 < result.size() && result[i + 1] == '\'') {
			// doubled quote inside a literal
			result[i] = result[i + 1] = ' ';
			++i;
			continue;
		}
		in_literal = !in_literal;
	}
	return result;
}

static void CheckDeniedTokens(const std::string &stripped) {
	std::smatch m;
	if (std::regex_search(stripped, m, _re_denied_verbs)) {
		std::string verb = boost::algorithm::to_upper_copy(m.str(1));
		Log()->warn("query rejected: contains {}", verb);
		throw SecurityException("Query contains forbidden keyword " + verb);
	}
	if (std::regex_search(stripped, m, _re_file_functions)) {
		Log()->warn("query rejected: calls {}", m.str(1));
		throw SecurityException("Query calls forbidden function " + m.str(1));
	}
}

namespace {

//! Walks a parsed SELECT and records the base tables it reads
class TableCollector {
public:
	void VisitNode(const duckdb::QueryNode &node) {
		for (auto &entry : node.cte_map.map) {
			cte_names.insert(boost::algorithm::to_lower_copy(entry.first));
			VisitNode(*entry.second->query->node);
		}
		switch (node.type) {
		case duckdb::QueryNodeType::SELECT_NODE: {
			auto &select = node.Cast<duckdb::SelectNode>();
			for (auto &expr : select.select_list) {
				VisitExpression(expr.get());
			}
			if (select.from_table) {
				VisitRef(*select.from_table);
			}
			VisitExpression(select.where_clause.get());
			for (auto &expr : select.groups.group_expressions) {
				VisitExpression(expr.get());
			}
			VisitExpression(select.having.get());
			VisitExpression(select.qualify.get());
			break;
		}
		case duckdb::QueryNodeType::SET_OPERATION_NODE: {
			auto &setop = node.Cast<duckdb::SetOperationNode>();
			VisitNode(*setop.left);
			VisitNode(*setop.right);
			break;
		}
		case duckdb::QueryNodeType::RECURSIVE_CTE_NODE: {
			auto &cte = node.Cast<duckdb::RecursiveCTENode>();
			cte_names.insert(boost::algorithm::to_lower_copy(cte.ctename));
			VisitNode(*cte.left);
			VisitNode(*cte.right);
			break;
		}
		case duckdb::QueryNodeType::CTE_NODE: {
			auto &cte = node.Cast<duckdb::CTENode>();
			cte_names.insert(boost::algorithm::to_lower_copy(cte.ctename));
			VisitNode(*cte.query);
			VisitNode(*cte.child);
			break;
		}
		default:
			throw SecurityException("Unsupported query form");
		}
		for (auto &modifier : node.modifiers) {
			if (modifier->type == duckdb::ResultModifierType::ORDER_MODIFIER) {
				for (auto &order : modifier->Cast<duckdb::OrderModifier>().orders) {
					VisitExpression(order.expression.get());
				}
			} else if (modifier->type == duckdb::ResultModifierType::LIMIT_MODIFIER) {
				auto &limit = modifier->Cast<duckdb::LimitModifier>();
				VisitExpression(limit.limit.get());
				VisitExpression(limit.offset.get());
			}
		}
	}

	//! Tables read, names of common table expressions dropped
	std::vector<TableReference> Tables() const {
		std::vector<TableReference> result;
		for (auto &ref : tables) {
			bool unqualified = ref.catalog.empty() && ref.schema.empty();
			if (unqualified && cte_names.count(boost::algorithm::to_lower_copy(ref.table))) {
				continue;
			}
			result.push_back(ref);
		}
		return result;
	}

private:
	void VisitRef(const duckdb::TableRef &ref) {
		switch (ref.type) {
		case duckdb::TableReferenceType::BASE_TABLE: {
			auto &base = ref.Cast<duckdb::BaseTableRef>();
			tables.push_back(TableReference {base.catalog_name, base.schema_name, base.table_name});
			break;
		}
		case duckdb::TableReferenceType::JOIN: {
			auto &join = ref.Cast<duckdb::JoinRef>();
			VisitRef(*join.left);
			VisitRef(*join.right);
			VisitExpression(join.condition.get());
			break;
		}
		case duckdb::TableReferenceType::SUBQUERY:
			VisitNode(*ref.Cast<duckdb::SubqueryRef>().subquery->node);
			break;
		case duckdb::TableReferenceType::EXPRESSION_LIST:
			for (auto &row : ref.Cast<duckdb::ExpressionListRef>().values) {
				for (auto &expr : row) {
					VisitExpression(expr.get());
				}
			}
			break;
		case duckdb::TableReferenceType::PIVOT:
			VisitRef(*ref.Cast<duckdb::PivotRef>().source);
			break;
		case duckdb::TableReferenceType::EMPTY_FROM:
			break;
		case duckdb::TableReferenceType::TABLE_FUNCTION:
			Log()->warn("query rejected: reads a table function");
			throw SecurityException("Table functions are not allowed in queries");
		default:
			Log()->warn("query rejected: unsupported table reference");
			throw SecurityException("Unsupported table reference in query");
		}
	}

	void VisitExpression(const duckdb::ParsedExpression *expr) {
		if (!expr) {
			return;
		}
		if (expr->GetExpressionClass() == duckdb::ExpressionClass::SUBQUERY) {
			VisitNode(*expr->Cast<duckdb::SubqueryExpression>().subquery->node);
		}
		duckdb::ParsedExpressionIterator::EnumerateChildren(
		    *expr, [&](const duckdb::ParsedExpression &child) { VisitExpression(&child); });
	}

	std::vector<TableReference> tables;
	boost::unordered_set<std::string> cte_names;
};

std::string QualifiedName(const TableReference &ref) {
	std::string name;
	for (auto &part : {ref.catalog, ref.schema}) {
		if (!part.empty()) {
			name += part + ".";
		}
	}
	return name + ref.table;
}

} // namespace

std::vector<TableReference> CheckReadOnlyQuery(const std::string &sql) {
	if (boost::algorithm::trim_copy(sql).empty()) {
		throw ValidationException("Query is empty", "Provide a SELECT statement");
	}
	CheckDeniedTokens(StripStringLiterals(sql));

	duckdb::Parser parser;
	try {
		parser.ParseQuery(sql);
	} catch (std::exception &ex) {
		throw ValidationException("Could not parse query: " + duckdb::ErrorData(ex).Message(),
		                          "Check the SQL syntax");
	}
	if (parser.statements.size() != 1) {
		Log()->warn("query rejected: {} statements", parser.statements.size());
		throw SecurityException("Exactly one statement is allowed, got " + std::to_string(parser.statements.size()));
	}
	if (parser.statements[0]->type != duckdb::StatementType::SELECT_STATEMENT) {
		Log()->warn("query rejected: not a SELECT statement");
		throw SecurityException("Only SELECT statements are allowed");
	}
	TableCollector collector;
	collector.VisitNode(*parser.statements[0]->Cast<duckdb::SelectStatement>().node);
	return collector.Tables();
}

void CheckImportedDataQuery(const std::string &sql) {
	for (auto &ref : CheckReadOnlyQuery(sql)) {
		bool imported = ref.catalog.empty() && ref.schema.empty() &&
		                boost::algorithm::iequals(ref.table, IngestSession::TABLE_NAME);
		if (!imported) {
			Log()->warn("query rejected: reads {}", QualifiedName(ref));
			throw SecurityException("Queries may only read " + std::string(IngestSession::TABLE_NAME) + ", not '" +
			                        QualifiedName(ref) + "'");
		}
	}
}

void CheckFilterPredicate(const std::string &predicate) {
	const std::string example = "Example: state = 'CA' AND weight > 5";
	if (boost::algorithm::trim_copy(predicate).empty()) {
		throw ValidationException("Filter must not be empty", example);
	}
	std::string stripped = StripStringLiterals(predicate);
	if (stripped.find(';') != std::string::npos) {
		throw ValidationException("Filter must not contain ';'", example);
	}
	if (stripped.find("--") != std::string::npos || stripped.find("/*") != std::string::npos) {
		throw ValidationException("Filter must not contain comments", example);
	}
	CheckImportedDataQuery("SELECT * FROM " + std::string(IngestSession::TABLE_NAME) + " WHERE (" + predicate + ")");
}

} // namespace dsingest
