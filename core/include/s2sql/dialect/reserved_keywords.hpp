// s2sql/dialect/reserved_keywords.hpp - Identifier quoting data
#pragma once

#include <gsl/span>
#include <string_view>

namespace s2sql::dialect
{

/// SingleStore restricted keywords, lower-case and sorted.
[[nodiscard]] gsl::span<const std::string_view> singlestore_reserved_keywords() noexcept;

/// Case-insensitive membership test against the SingleStore list.
[[nodiscard]] bool is_singlestore_reserved(std::string_view word);

}  // namespace s2sql::dialect
