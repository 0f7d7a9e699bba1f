// s2sql/time/time_mappings.cpp - Built-in directive tables
#include "s2sql/time/time_mappings.hpp"

namespace s2sql::time
{

const DirectiveTable & singlestore_time_table()
{
  static const DirectiveTable table(
    "singlestore", {
                     {"D", "%u"},     // day of week (1-7)
                     {"DD", "%d"},    // day of month (01-31)
                     {"DY", "%a"},    // abbreviated day name
                     {"HH", "%I"},    // hour (01-12)
                     {"HH12", "%I"},  // alias for HH
                     {"HH24", "%H"},  // hour (00-23)
                     {"MI", "%M"},    // minute (00-59)
                     {"MM", "%m"},    // month (01-12)
                     {"MON", "%b"},   // abbreviated month name
                     {"MONTH", "%B"},
                     {"SS", "%S"},
                     {"RR", "%y"},
                     {"YY", "%y"},
                     {"YYYY", "%Y"},
                     {"FF6", "%f"},  // microseconds; only 6 digits supported
                   });
  return table;
}

const DirectiveTable & mysql_time_table()
{
  // Later registrations win when encoding: %I -> %h, %S -> %s.
  static const DirectiveTable table(
    "mysql", {
               {"%Y", "%Y"},
               {"%y", "%y"},
               {"%m", "%m"},
               {"%c", "%-m"},
               {"%M", "%B"},
               {"%b", "%b"},
               {"%d", "%d"},
               {"%e", "%-d"},
               {"%j", "%j"},
               {"%a", "%a"},
               {"%W", "%A"},
               {"%w", "%w"},
               {"%U", "%U"},
               {"%u", "%W"},
               {"%H", "%H"},
               {"%k", "%-H"},
               {"%I", "%I"},
               {"%h", "%I"},
               {"%l", "%-I"},
               {"%i", "%M"},
               {"%S", "%S"},
               {"%s", "%S"},
               {"%f", "%f"},
               {"%p", "%p"},
               {"%r", "%r"},
               {"%T", "%T"},
               {"%%", "%%"},
             });
  return table;
}

}  // namespace s2sql::time
