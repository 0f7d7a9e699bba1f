#include <gtest/gtest.h>

#include <string>

#include "s2sql/ast/ast.hpp"
#include "s2sql/basic/casting.hpp"
#include "s2sql/test_support/parse_helpers.hpp"

using s2sql::cast;
using s2sql::dyn_cast;
using s2sql::test_support::find_first;
using s2sql::test_support::parse;

namespace
{

const s2sql::SelectStmt * as_select(const s2sql::Stmt * s)
{
  return dyn_cast<s2sql::SelectStmt>(s);
}

const s2sql::Expr * first_item(const s2sql::test_support::TestParseUnit & unit)
{
  const auto * sel = as_select(unit.stmt(0));
  if (!sel || sel->items.empty()) return nullptr;
  return sel->items[0]->expr;
}

}  // namespace

// ============================================================================
// Statements
// ============================================================================

TEST(SyntaxParser, SelectClauses)
{
  auto unit = parse(
    "SELECT DISTINCT a AS x, t.b y, t.* FROM db.tbl AS t "
    "WHERE a = 1 AND b <> 2 ORDER BY a DESC, b LIMIT 10 OFFSET 5");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.script->statements.size(), 1U);

  const auto * sel = as_select(unit.stmt(0));
  ASSERT_NE(sel, nullptr);
  EXPECT_TRUE(sel->distinct);

  ASSERT_EQ(sel->items.size(), 3U);
  EXPECT_EQ(sel->items[0]->alias, "x");
  EXPECT_EQ(sel->items[1]->alias, "y");
  const auto * col = dyn_cast<s2sql::ColumnRefExpr>(sel->items[1]->expr);
  ASSERT_NE(col, nullptr);
  EXPECT_EQ(col->qualifier, "t");
  EXPECT_EQ(col->name, "b");
  const auto * star = dyn_cast<s2sql::StarExpr>(sel->items[2]->expr);
  ASSERT_NE(star, nullptr);
  EXPECT_EQ(star->qualifier, "t");

  ASSERT_NE(sel->from, nullptr);
  EXPECT_EQ(sel->from->schema, "db");
  EXPECT_EQ(sel->from->name, "tbl");
  EXPECT_EQ(sel->from->alias, "t");

  const auto * where = dyn_cast<s2sql::BinaryExpr>(sel->where);
  ASSERT_NE(where, nullptr);
  EXPECT_EQ(where->op, s2sql::BinaryOp::And);
  EXPECT_EQ(cast<s2sql::BinaryExpr>(where->rhs)->op, s2sql::BinaryOp::Ne);

  ASSERT_EQ(sel->order_by.size(), 2U);
  EXPECT_EQ(sel->order_by[0]->direction, s2sql::OrderDirection::Desc);
  EXPECT_EQ(sel->order_by[1]->direction, s2sql::OrderDirection::Unspecified);
  EXPECT_FALSE(sel->order_by_all);

  ASSERT_NE(sel->limit, nullptr);
  EXPECT_EQ(cast<s2sql::NumberLiteralExpr>(sel->limit)->text, "10");
  ASSERT_NE(sel->offset, nullptr);
  EXPECT_EQ(cast<s2sql::NumberLiteralExpr>(sel->offset)->text, "5");
}

TEST(SyntaxParser, MySqlStyleLimit)
{
  auto unit = parse("SELECT a FROM t LIMIT 5, 10");
  ASSERT_TRUE(unit.diags.empty());

  const auto * sel = as_select(unit.stmt(0));
  ASSERT_NE(sel, nullptr);
  EXPECT_EQ(cast<s2sql::NumberLiteralExpr>(sel->offset)->text, "5");
  EXPECT_EQ(cast<s2sql::NumberLiteralExpr>(sel->limit)->text, "10");
}

TEST(SyntaxParser, MultipleStatements)
{
  auto unit = parse("SELECT 1; TO_DATE('2020', 'YYYY');;");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.script->statements.size(), 2U);
  EXPECT_NE(as_select(unit.stmt(0)), nullptr);
  EXPECT_NE(dyn_cast<s2sql::ExprStmt>(unit.stmt(1)), nullptr);
}

TEST(SyntaxParser, OrderByAll)
{
  auto unit = parse("SELECT a, b FROM t ORDER BY ALL DESC");
  ASSERT_TRUE(unit.diags.empty());

  const auto * sel = as_select(unit.stmt(0));
  ASSERT_NE(sel, nullptr);
  EXPECT_TRUE(sel->order_by_all);
  EXPECT_EQ(sel->order_all_direction, s2sql::OrderDirection::Desc);
  EXPECT_TRUE(sel->order_by.empty());
}

TEST(SyntaxParser, OrderByAllRejectedByMySql)
{
  auto unit = parse("SELECT a FROM t ORDER BY ALL", "mysql");
  EXPECT_TRUE(unit.diags.has_code("E0203"));

  // Still parsed so the rest of the statement is checked.
  const auto * sel = as_select(unit.stmt(0));
  ASSERT_NE(sel, nullptr);
  EXPECT_TRUE(sel->order_by_all);
}

// ============================================================================
// Expressions
// ============================================================================

TEST(SyntaxParser, ArithmeticPrecedence)
{
  auto unit = parse("SELECT 1 + 2 * 3 - -4");
  ASSERT_TRUE(unit.diags.empty());

  // (1 + (2 * 3)) - (-4)
  const auto * sub = dyn_cast<s2sql::BinaryExpr>(first_item(unit));
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(sub->op, s2sql::BinaryOp::Sub);
  const auto * add = dyn_cast<s2sql::BinaryExpr>(sub->lhs);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, s2sql::BinaryOp::Add);
  EXPECT_EQ(cast<s2sql::BinaryExpr>(add->rhs)->op, s2sql::BinaryOp::Mul);
  const auto * neg = dyn_cast<s2sql::UnaryExpr>(sub->rhs);
  ASSERT_NE(neg, nullptr);
  EXPECT_EQ(neg->op, s2sql::UnaryOp::Neg);
}

TEST(SyntaxParser, PredicateForms)
{
  auto unit = parse("SELECT a FROM t WHERE a IS NOT NULL OR b NOT LIKE 'x%' OR c <=> NULL");
  ASSERT_TRUE(unit.diags.empty());

  const auto * is_null = find_first<s2sql::IsNullExpr>(unit.script);
  ASSERT_NE(is_null, nullptr);
  EXPECT_TRUE(is_null->negated);

  const auto * not_like = find_first<s2sql::UnaryExpr>(unit.script);
  ASSERT_NE(not_like, nullptr);
  EXPECT_EQ(not_like->op, s2sql::UnaryOp::Not);
  EXPECT_EQ(cast<s2sql::BinaryExpr>(not_like->operand)->op, s2sql::BinaryOp::Like);

  bool saw_null_safe = false;
  const auto * where = cast<s2sql::BinaryExpr>(as_select(unit.stmt(0))->where);
  if (const auto * rhs = dyn_cast<s2sql::BinaryExpr>(where->rhs)) {
    saw_null_safe = rhs->op == s2sql::BinaryOp::NullSafeEq;
  }
  EXPECT_TRUE(saw_null_safe);
}

TEST(SyntaxParser, CastForms)
{
  auto unit = parse(
    "SELECT x :> INT, y !:> BSON, z::VARCHAR(20), CAST(w AS DECIMAL(10, 2)), v :> my_type");
  ASSERT_TRUE(unit.diags.empty());

  const auto * sel = as_select(unit.stmt(0));
  ASSERT_NE(sel, nullptr);
  ASSERT_EQ(sel->items.size(), 5U);

  const auto * c0 = cast<s2sql::CastExpr>(sel->items[0]->expr);
  EXPECT_EQ(c0->style, s2sql::CastStyle::Operator);
  EXPECT_EQ(c0->target_type->type_kind, s2sql::DataTypeKind::Int);

  const auto * c1 = cast<s2sql::CastExpr>(sel->items[1]->expr);
  EXPECT_TRUE(c1->is_try());
  EXPECT_EQ(c1->target_type->type_kind, s2sql::DataTypeKind::Bson);

  const auto * c2 = cast<s2sql::CastExpr>(sel->items[2]->expr);
  EXPECT_EQ(c2->style, s2sql::CastStyle::Function);
  EXPECT_EQ(c2->target_type->type_kind, s2sql::DataTypeKind::Varchar);
  ASSERT_EQ(c2->target_type->params.size(), 1U);
  EXPECT_EQ(c2->target_type->params[0], "20");

  const auto * c3 = cast<s2sql::CastExpr>(sel->items[3]->expr);
  EXPECT_EQ(c3->target_type->type_kind, s2sql::DataTypeKind::Decimal);
  ASSERT_EQ(c3->target_type->params.size(), 2U);
  EXPECT_EQ(c3->target_type->params[1], "2");

  const auto * c4 = cast<s2sql::CastExpr>(sel->items[4]->expr);
  EXPECT_EQ(c4->target_type->type_kind, s2sql::DataTypeKind::Other);
  EXPECT_EQ(c4->target_type->name, "my_type");
}

TEST(SyntaxParser, JsonExtraction)
{
  auto unit = parse("SELECT j::$name, j::%`score`, j::$'a b'");
  ASSERT_TRUE(unit.diags.empty());

  const auto * sel = as_select(unit.stmt(0));
  ASSERT_EQ(sel->items.size(), 3U);

  const auto * e0 = cast<s2sql::JsonExtractExpr>(sel->items[0]->expr);
  EXPECT_EQ(e0->extract_kind, s2sql::JsonExtractKind::String);
  EXPECT_EQ(e0->key, "name");

  const auto * e1 = cast<s2sql::JsonExtractExpr>(sel->items[1]->expr);
  EXPECT_EQ(e1->extract_kind, s2sql::JsonExtractKind::Double);
  EXPECT_EQ(e1->key, "score");

  EXPECT_EQ(cast<s2sql::JsonExtractExpr>(sel->items[2]->expr)->key, "a b");
}

TEST(SyntaxParser, StringEscapes)
{
  auto unit = parse(R"(SELECT 'it''s', 'a\nb', 'x\%y', "q\"q", e'raw')");
  ASSERT_TRUE(unit.diags.empty());

  const auto * sel = as_select(unit.stmt(0));
  ASSERT_EQ(sel->items.size(), 5U);
  EXPECT_EQ(cast<s2sql::StringLiteralExpr>(sel->items[0]->expr)->value, "it's");
  EXPECT_EQ(cast<s2sql::StringLiteralExpr>(sel->items[1]->expr)->value, "a\nb");
  EXPECT_EQ(cast<s2sql::StringLiteralExpr>(sel->items[2]->expr)->value, "x\\%y");
  EXPECT_EQ(cast<s2sql::StringLiteralExpr>(sel->items[3]->expr)->value, "q\"q");

  const auto * bytes = cast<s2sql::StringLiteralExpr>(sel->items[4]->expr);
  EXPECT_TRUE(bytes->is_byte_string);
  EXPECT_EQ(bytes->value, "raw");
}

// ============================================================================
// Temporal functions
// ============================================================================

TEST(SyntaxParser, LiteralFormatIsDecoded)
{
  auto unit = parse("SELECT TO_DATE(x, 'YYYY-MM-DD')");
  ASSERT_TRUE(unit.diags.empty());

  const auto * t = dyn_cast<s2sql::TemporalExpr>(first_item(unit));
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->op, s2sql::TemporalOp::TsOrDsToDate);
  EXPECT_EQ(t->spelled_name, "TO_DATE");
  EXPECT_EQ(cast<s2sql::ColumnRefExpr>(t->value)->name, "x");

  const auto * f = dyn_cast<s2sql::TimeFormatExpr>(t->format);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->original, "YYYY-MM-DD");
  EXPECT_EQ(f->table, "singlestore");
  ASSERT_EQ(f->pieces.size(), 5U);
  EXPECT_EQ(f->pieces[0].kind, s2sql::time::FormatElementKind::Directive);
  EXPECT_EQ(f->pieces[0].text, "%Y");
  EXPECT_EQ(f->pieces[1].kind, s2sql::time::FormatElementKind::Literal);
  EXPECT_EQ(f->pieces[1].text, "-");
  EXPECT_EQ(f->pieces[4].text, "%d");
}

TEST(SyntaxParser, FunctionNamesAreCaseInsensitive)
{
  auto unit = parse("select to_timestamp(x, 'HH24:MI')");
  ASSERT_TRUE(unit.diags.empty());

  const auto * t = dyn_cast<s2sql::TemporalExpr>(first_item(unit));
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->op, s2sql::TemporalOp::StrToTime);
  EXPECT_EQ(t->spelled_name, "to_timestamp");
}

TEST(SyntaxParser, RuntimeAndMissingFormats)
{
  {
    auto unit = parse("SELECT TO_CHAR(d, fmt_col)");
    ASSERT_TRUE(unit.diags.empty());
    const auto * t = cast<s2sql::TemporalExpr>(first_item(unit));
    EXPECT_NE(dyn_cast<s2sql::ColumnRefExpr>(t->format), nullptr);
  }
  {
    auto unit = parse("SELECT TO_DATE(x)");
    ASSERT_TRUE(unit.diags.empty());
    const auto * t = cast<s2sql::TemporalExpr>(first_item(unit));
    EXPECT_EQ(t->format, nullptr);
  }
}

TEST(SyntaxParser, MySqlFormatsInSingleStore)
{
  auto unit = parse("SELECT STR_TO_DATE(s, '%Y-%m-%d %H:%i')");
  ASSERT_TRUE(unit.diags.empty());

  const auto * t = cast<s2sql::TemporalExpr>(first_item(unit));
  EXPECT_EQ(t->op, s2sql::TemporalOp::StrToDate);
  const auto * f = cast<s2sql::TimeFormatExpr>(t->format);
  EXPECT_EQ(f->table, "mysql");
  ASSERT_FALSE(f->pieces.empty());
  EXPECT_EQ(f->pieces.back().text, "%M");
}

TEST(SyntaxParser, TimeFormatCoercesToTimeOfDay)
{
  auto unit = parse("SELECT TIME_FORMAT(t, '%H:%i')");
  ASSERT_TRUE(unit.diags.empty());

  const auto * t = cast<s2sql::TemporalExpr>(first_item(unit));
  EXPECT_EQ(t->op, s2sql::TemporalOp::TimeToStr);

  const auto * coerced = dyn_cast<s2sql::CastExpr>(t->value);
  ASSERT_NE(coerced, nullptr);
  EXPECT_EQ(coerced->target_type->type_kind, s2sql::DataTypeKind::Time);
  ASSERT_EQ(coerced->target_type->params.size(), 1U);
  EXPECT_EQ(coerced->target_type->params[0], "6");
  EXPECT_EQ(cast<s2sql::ColumnRefExpr>(coerced->expr)->name, "t");
}

TEST(SyntaxParser, TimeFormatCoercesLiteralTime)
{
  auto unit = parse("SELECT TIME_FORMAT('12:05:47', '%H:%i:%s')");
  ASSERT_TRUE(unit.diags.empty());

  const auto * t = cast<s2sql::TemporalExpr>(first_item(unit));
  const auto * coerced = dyn_cast<s2sql::CastExpr>(t->value);
  ASSERT_NE(coerced, nullptr);
  EXPECT_EQ(coerced->style, s2sql::CastStyle::Function);
  EXPECT_EQ(coerced->target_type->type_kind, s2sql::DataTypeKind::Time);
  ASSERT_EQ(coerced->target_type->params.size(), 1U);
  EXPECT_EQ(coerced->target_type->params[0], "6");

  const auto * literal = dyn_cast<s2sql::StringLiteralExpr>(coerced->expr);
  ASSERT_NE(literal, nullptr);
  EXPECT_EQ(literal->value, "12:05:47");
}

TEST(SyntaxParser, TemporalArityErrors)
{
  {
    auto unit = parse("SELECT STR_TO_DATE(x)");
    ASSERT_EQ(unit.diags.size(), 1U);
    EXPECT_EQ(unit.diags.all()[0].code, "E0202");
    EXPECT_EQ(unit.diags.all()[0].message, "STR_TO_DATE takes 2 arguments, got 1");
    // Kept as a plain call
    EXPECT_NE(dyn_cast<s2sql::FunctionCallExpr>(first_item(unit)), nullptr);
  }
  {
    auto unit = parse("SELECT TO_DATE(a, b, c)");
    ASSERT_EQ(unit.diags.size(), 1U);
    EXPECT_EQ(unit.diags.all()[0].message, "TO_DATE takes 1 to 2 arguments, got 3");
  }
}

TEST(SyntaxParser, UnknownFunctionStaysGeneric)
{
  auto unit = parse("SELECT COALESCE(a, 1)", "mysql");
  ASSERT_TRUE(unit.diags.empty());

  const auto * call = dyn_cast<s2sql::FunctionCallExpr>(first_item(unit));
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->name, "COALESCE");
  EXPECT_EQ(call->args.size(), 2U);

  // TO_DATE is not a MySQL function
  auto other = parse("SELECT TO_DATE(x, 'YYYY')", "mysql");
  EXPECT_NE(dyn_cast<s2sql::FunctionCallExpr>(first_item(other)), nullptr);
}

// ============================================================================
// Recovery
// ============================================================================

TEST(SyntaxParser, ReportsSyntaxErrors)
{
  {
    auto unit = parse("SELECT 1 +");
    EXPECT_TRUE(unit.diags.has_code("E0201"));
    EXPECT_NE(find_first<s2sql::MissingExpr>(unit.script), nullptr);
  }
  {
    auto unit = parse("SELECT (1");
    ASSERT_EQ(unit.diags.size(), 1U);
    EXPECT_EQ(unit.diags.all()[0].message, "expected ')' after expression");
  }
  {
    auto unit = parse("SELECT 1 2; SELECT 3");
    EXPECT_TRUE(unit.diags.has_code("E0201"));
    // Recovery resumes at the next statement.
    EXPECT_EQ(unit.script->statements.size(), 2U);
  }
}
