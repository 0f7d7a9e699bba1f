// s2sql/time/time_mappings.hpp - Built-in directive tables
#pragma once

#include "s2sql/time/directive_table.hpp"

namespace s2sql::time
{

/**
 * SingleStore TO_DATE / TO_TIMESTAMP / TO_CHAR tokens.
 *
 * `HH`/`HH12` and `RR`/`YY` share a directive; encoding picks `HH12` and `YY`.
 */
[[nodiscard]] const DirectiveTable & singlestore_time_table();

/**
 * MySQL STR_TO_DATE / DATE_FORMAT / TIME_FORMAT `%` specifiers.
 *
 * Note the MySQL specifiers whose canonical meaning differs from their
 * spelling: `%i` is minutes (`%M`), `%M` is the month name (`%B`),
 * `%W` the weekday name (`%A`).
 */
[[nodiscard]] const DirectiveTable & mysql_time_table();

}  // namespace s2sql::time
