// s2sql/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// Dispatch is generated from ast_nodes.def; there is no virtual dispatch.
//
#pragma once

#include <type_traits>

#include "s2sql/ast/ast.hpp"
#include "s2sql/ast/ast_enums.hpp"
#include "s2sql/basic/casting.hpp"

namespace s2sql
{

namespace detail
{

/// Propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor.
 *
 * The derived class implements `visit_<snake>` for the nodes it cares about;
 * everything else falls through to the category methods and finally
 * visit_node().
 *
 * @code
 *   class Printer : public ConstAstVisitor<Printer> {
 *   public:
 *     void visit_column_ref_expr(const ColumnRefExpr * node) { ... }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TYPE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "s2sql/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "s2sql/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * Visitor that walks into child nodes.
 *
 * Override a visit method to act on a node; call the base implementation
 * to keep descending, or return false to stop the whole walk.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  bool visit_paren_expr(NodePtr<ParenExpr> node) { return get_derived().visit(node->inner); }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    return get_derived().visit(node->rhs);
  }

  bool visit_is_null_expr(NodePtr<IsNullExpr> node) { return get_derived().visit(node->operand); }

  bool visit_function_call_expr(NodePtr<FunctionCallExpr> node)
  {
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_cast_expr(NodePtr<CastExpr> node)
  {
    if (!get_derived().visit(node->expr)) return false;
    return get_derived().visit(node->target_type);
  }

  bool visit_json_extract_expr(NodePtr<JsonExtractExpr> node)
  {
    return get_derived().visit(node->expr);
  }

  bool visit_temporal_expr(NodePtr<TemporalExpr> node)
  {
    if (!get_derived().visit(node->value)) return false;
    return !node->format || get_derived().visit(node->format);
  }

  bool visit_select_item(NodePtr<SelectItem> node) { return get_derived().visit(node->expr); }

  bool visit_order_item(NodePtr<OrderItem> node) { return get_derived().visit(node->expr); }

  bool visit_select_stmt(NodePtr<SelectStmt> node)
  {
    for (auto * item : node->items) {
      if (!get_derived().visit(item)) return false;
    }
    if (node->from && !get_derived().visit(node->from)) return false;
    if (node->where && !get_derived().visit(node->where)) return false;
    for (auto * item : node->order_by) {
      if (!get_derived().visit(item)) return false;
    }
    if (node->limit && !get_derived().visit(node->limit)) return false;
    return !node->offset || get_derived().visit(node->offset);
  }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_script(NodePtr<Script> node)
  {
    for (auto * stmt : node->statements) {
      if (!get_derived().visit(stmt)) return false;
    }
    return true;
  }

  /// Leaves
  bool visit_node(NodePtrT /*node*/) { return true; }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace s2sql
