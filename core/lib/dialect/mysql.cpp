// s2sql/dialect/mysql.cpp - MySQL base dialect definition
#include "s2sql/dialect/mysql.hpp"

#include "s2sql/time/time_mappings.hpp"

namespace s2sql::dialect
{

Dialect make_mysql_dialect()
{
  const auto & mysql = time::mysql_time_table();
  Dialect d("mysql", mysql);

  d.add_function_rule({.name = "STR_TO_DATE", .op = TemporalOp::StrToDate, .format_table = &mysql,
                       .min_args = 2});
  d.add_function_rule({.name = "DATE_FORMAT", .op = TemporalOp::TimeToStr, .format_table = &mysql,
                       .min_args = 2});

  // STR_TO_DATE and DATE_FORMAT both take exactly two arguments
  d.set_writer_rule(TemporalOp::TsOrDsToDate, {"STR_TO_DATE", &mysql, true, "DATE"});
  d.set_writer_rule(TemporalOp::StrToTime, {"STR_TO_DATE", &mysql, true, "TIMESTAMP"});
  d.set_writer_rule(TemporalOp::ToChar, {"DATE_FORMAT", &mysql, true});
  d.set_writer_rule(TemporalOp::StrToDate, {"STR_TO_DATE", &mysql, true});
  d.set_writer_rule(TemporalOp::TimeToStr, {"DATE_FORMAT", &mysql, true});

  // No binary JSON or point type; nearest equivalents
  d.set_type_name(DataTypeKind::Bson, "JSON");
  d.set_type_name(DataTypeKind::GeographyPoint, "POINT");
  d.set_type_name(DataTypeKind::Geography, "GEOMETRY");

  return d;
}

}  // namespace s2sql::dialect
