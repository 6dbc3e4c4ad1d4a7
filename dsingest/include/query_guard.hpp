#ifndef DSINGEST_QUERY_GUARD_HPP
#define DSINGEST_QUERY_GUARD_HPP

#include <string>
#include <vector>

namespace dsingest {

//! A base table named in a query, catalog and schema empty when unqualified
struct TableReference {
	std::string catalog;
	std::string schema;
	std::string table;
};

//! Replaces the contents of single-quoted literals with blanks, keeping the quotes
std::string StripStringLiterals(const std::string &sql);

//! Raises SecurityException unless `sql` is exactly one read-only SELECT statement: no
//! mutating or session verbs outside string literals, no file-reading table functions, and
//! the parser yields a single SELECT_STATEMENT that reads no table function. Malformed SQL
//! raises ValidationException. Returns the base tables the statement reads, common table
//! expressions excluded.
std::vector<TableReference> CheckReadOnlyQuery(const std::string &sql);

//! CheckReadOnlyQuery, and every table read must be the unqualified imported_data. Quoted
//! file paths in FROM are base tables to the parser and are refused here.
void CheckImportedDataQuery(const std::string &sql);

//! Checks a WHERE-clause fragment over imported_data. Statement separators and comments
//! raise ValidationException, denied verbs raise SecurityException.
void CheckFilterPredicate(const std::string &predicate);

} // namespace dsingest

#endif
