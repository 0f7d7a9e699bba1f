// s2sql/dialect/mysql.hpp - MySQL base dialect
#pragma once

#include "s2sql/dialect/dialect.hpp"

namespace s2sql::dialect
{

/**
 * MySQL: the base dialect SingleStore builds on.
 *
 * STR_TO_DATE and DATE_FORMAT take `%`-style formats; every temporal
 * operation is written back through those two functions.
 */
[[nodiscard]] Dialect make_mysql_dialect();

}  // namespace s2sql::dialect
