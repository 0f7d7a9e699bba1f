// s2sql/dialect/singlestore.cpp - SingleStore dialect definition
#include "s2sql/dialect/singlestore.hpp"

#include "s2sql/dialect/reserved_keywords.hpp"
#include "s2sql/time/time_mappings.hpp"

namespace s2sql::dialect
{

Dialect make_singlestore_dialect()
{
  const auto & s2 = time::singlestore_time_table();
  const auto & mysql = time::mysql_time_table();
  Dialect d("singlestore", s2);

  // --- Tokenizer ---
  auto & tok = d.tokenizer_config();
  tok.operators.insert(":>", syntax::TokenKind::ColonGt);
  tok.operators.insert("!:>", syntax::TokenKind::NColonGt);
  tok.operators.insert("::$", syntax::TokenKind::DColonDollar);
  tok.operators.insert("::%", syntax::TokenKind::DColonPercent);
  tok.byte_string_prefixes = {"e'", "E'"};
  tok.keywords.emplace("BSON", syntax::TokenKind::JsonbType);
  tok.keywords.emplace("GEOGRAPHYPOINT", syntax::TokenKind::GeographyPointType);

  auto & features = d.features();
  features.order_by_all = true;
  features.cast_operators = true;
  features.json_extract_operators = true;
  features.byte_strings = true;

  d.set_reserved_words(&is_singlestore_reserved);

  // --- Parser: function name -> temporal operation ---
  d.add_function_rule({.name = "TO_DATE", .op = TemporalOp::TsOrDsToDate, .format_table = &s2});
  d.add_function_rule({.name = "TO_TIMESTAMP", .op = TemporalOp::StrToTime, .format_table = &s2});
  d.add_function_rule({.name = "TO_CHAR", .op = TemporalOp::ToChar, .format_table = &s2});
  d.add_function_rule({.name = "STR_TO_DATE", .op = TemporalOp::StrToDate, .format_table = &mysql,
                       .min_args = 2});
  d.add_function_rule({.name = "DATE_FORMAT", .op = TemporalOp::TimeToStr, .format_table = &mysql,
                       .min_args = 2});
  d.add_function_rule({.name = "TIME_FORMAT", .op = TemporalOp::TimeToStr, .format_table = &mysql,
                       .min_args = 2, .coerce_time_of_day = true});

  // --- Generator: temporal operation -> function name ---
  d.set_writer_rule(TemporalOp::TsOrDsToDate, {"TO_DATE", &s2});
  d.set_writer_rule(TemporalOp::StrToTime, {"TO_TIMESTAMP", &s2});
  d.set_writer_rule(TemporalOp::ToChar, {"TO_CHAR", &s2});
  d.set_writer_rule(TemporalOp::StrToDate, {"STR_TO_DATE", &mysql, true});
  d.set_writer_rule(TemporalOp::TimeToStr, {"DATE_FORMAT", &mysql, true});

  return d;
}

}  // namespace s2sql::dialect
