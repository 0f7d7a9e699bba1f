// s2sql/dialect/singlestore.hpp - SingleStore dialect
#pragma once

#include "s2sql/dialect/dialect.hpp"

namespace s2sql::dialect
{

/**
 * SingleStore: MySQL plus Oracle-style TO_DATE/TO_TIMESTAMP/TO_CHAR formats,
 * the `:>` `!:>` `::$` `::%` operators, e'...' byte strings, BSON and
 * GEOGRAPHYPOINT types, ORDER BY ALL and a restricted-keyword list.
 */
[[nodiscard]] Dialect make_singlestore_dialect();

}  // namespace s2sql::dialect
