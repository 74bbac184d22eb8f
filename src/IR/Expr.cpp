/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "Expr.h"
#include "DateTime.h"
#include "FunctionRegistry.h"

#include "Logger/Logger.h"

#include <boost/functional/hash.hpp>

#include <cstring>
#include <sstream>
#include <unordered_set>

namespace lqe::ir {

namespace {

std::string datumToString(const Datum& value, const Type* type) {
  if (lqe::isNull(value)) {
    return "null";
  }
  if (auto ival = std::get_if<int64_t>(&value)) {
    if (type->isBoolean()) {
      return *ival ? "true" : "false";
    }
    if (type->isDate()) {
      return formatDate(*ival);
    }
    if (type->isTimestamp()) {
      return formatTimestamp(*ival);
    }
    return std::to_string(*ival);
  }
  if (auto dval = std::get_if<double>(&value)) {
    std::ostringstream ss;
    ss << *dval;
    return ss.str();
  }
  return "\"" + std::get<std::string>(value) + "\"";
}

size_t datumHash(const Datum& value) {
  size_t res = value.index();
  if (auto ival = std::get_if<int64_t>(&value)) {
    boost::hash_combine(res, *ival);
  } else if (auto dval = std::get_if<double>(&value)) {
    boost::hash_combine(res, *dval);
  } else if (auto sval = std::get_if<std::string>(&value)) {
    boost::hash_combine(res, *sval);
  }
  return res;
}

// Bitwise comparison for doubles keeps 0.0 and -0.0 apart.
bool datumEqual(const Datum& lhs, const Datum& rhs) {
  if (lhs.index() != rhs.index()) {
    return false;
  }
  if (auto lval = std::get_if<double>(&lhs)) {
    auto rval = std::get<double>(rhs);
    return std::memcmp(lval, &rval, sizeof(double)) == 0;
  }
  return lhs == rhs;
}

void collectColumns(const ExprArena& arena,
                    ExprId id,
                    std::vector<std::string>& res,
                    std::unordered_set<std::string>& seen) {
  auto expr = arena.get(id);
  if (auto col_ref = expr->as<ColumnRef>()) {
    if (seen.insert(col_ref->name()).second) {
      res.push_back(col_ref->name());
    }
    return;
  }
  for (auto child : expr->children()) {
    collectColumns(arena, child, res, seen);
  }
}

template <typename Pred>
bool anyExpr(const ExprArena& arena, ExprId id, Pred pred) {
  auto expr = arena.get(id);
  if (pred(expr)) {
    return true;
  }
  for (auto child : expr->children()) {
    if (anyExpr(arena, child, pred)) {
      return true;
    }
  }
  return false;
}

}  // namespace

size_t Expr::hash() const {
  size_t res = static_cast<size_t>(kind_);
  boost::hash_combine(res, type_);
  return res;
}

bool Expr::equal(const Expr& other) const {
  return kind_ == other.kind_ && type_->equal(*other.type_);
}

std::unique_ptr<Expr> ColumnRef::withChildren(const ExprIdList& children) const {
  CHECK(children.empty());
  return std::make_unique<ColumnRef>(type(), name_);
}

size_t ColumnRef::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, name_);
  return res;
}

bool ColumnRef::equal(const Expr& other) const {
  return Expr::equal(other) && static_cast<const ColumnRef&>(other).name_ == name_;
}

std::string ColumnRef::toString(const ExprArena&) const {
  return "col(" + name_ + ")";
}

std::unique_ptr<Expr> Literal::withChildren(const ExprIdList& children) const {
  CHECK(children.empty());
  return std::make_unique<Literal>(type(), value_);
}

size_t Literal::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, datumHash(value_));
  return res;
}

bool Literal::equal(const Expr& other) const {
  return Expr::equal(other) && datumEqual(static_cast<const Literal&>(other).value_, value_);
}

std::string Literal::toString(const ExprArena&) const {
  return "lit(" + datumToString(value_, type()) + ")";
}

std::unique_ptr<Expr> BinOper::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), (size_t)2);
  return std::make_unique<BinOper>(type(), op_, children[0], children[1]);
}

size_t BinOper::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, static_cast<int>(op_));
  boost::hash_combine(res, lhs_);
  boost::hash_combine(res, rhs_);
  return res;
}

bool BinOper::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const BinOper&>(other);
  return op_ == rhs.op_ && lhs_ == rhs.lhs_ && rhs_ == rhs.rhs_;
}

std::string BinOper::toString(const ExprArena& arena) const {
  return "(" + arena.toString(lhs_) + " " + ::toString(op_) + " " + arena.toString(rhs_) +
         ")";
}

std::unique_ptr<Expr> UOper::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), (size_t)1);
  return std::make_unique<UOper>(type(), op_, children[0]);
}

size_t UOper::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, static_cast<int>(op_));
  boost::hash_combine(res, operand_);
  return res;
}

bool UOper::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const UOper&>(other);
  return op_ == rhs.op_ && operand_ == rhs.operand_;
}

std::string UOper::toString(const ExprArena& arena) const {
  return ::toString(op_) + "(" + arena.toString(operand_) + ")";
}

const std::string& FunctionOper::name() const {
  return desc_->name;
}

std::unique_ptr<Expr> FunctionOper::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), args_.size());
  return std::make_unique<FunctionOper>(type(), desc_, children);
}

size_t FunctionOper::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, desc_->name);
  boost::hash_combine(res, args_);
  return res;
}

bool FunctionOper::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const FunctionOper&>(other);
  return desc_ == rhs.desc_ && args_ == rhs.args_;
}

std::string FunctionOper::toString(const ExprArena& arena) const {
  return desc_->name + "(" + arena.toString(args_) + ")";
}

ExprIdList AggExpr::children() const {
  if (hasArg()) {
    return {arg_};
  }
  return {};
}

std::unique_ptr<Expr> AggExpr::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), hasArg() ? (size_t)1 : (size_t)0);
  return std::make_unique<AggExpr>(
      type(), agg_, children.empty() ? kInvalidExprId : children[0]);
}

size_t AggExpr::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, static_cast<int>(agg_));
  boost::hash_combine(res, arg_);
  return res;
}

bool AggExpr::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const AggExpr&>(other);
  return agg_ == rhs.agg_ && arg_ == rhs.arg_;
}

std::string AggExpr::toString(const ExprArena& arena) const {
  return ::toString(agg_) + "(" + (hasArg() ? arena.toString(arg_) : "") + ")";
}

ExprIdList WindowExpr::children() const {
  ExprIdList res;
  res.reserve(1 + partition_by_.size() + order_by_.size());
  res.push_back(func_);
  res.insert(res.end(), partition_by_.begin(), partition_by_.end());
  res.insert(res.end(), order_by_.begin(), order_by_.end());
  return res;
}

std::unique_ptr<Expr> WindowExpr::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), 1 + partition_by_.size() + order_by_.size());
  auto part_end = children.begin() + 1 + partition_by_.size();
  return std::make_unique<WindowExpr>(type(),
                                      children[0],
                                      ExprIdList(children.begin() + 1, part_end),
                                      ExprIdList(part_end, children.end()));
}

size_t WindowExpr::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, func_);
  boost::hash_combine(res, partition_by_);
  boost::hash_combine(res, order_by_);
  return res;
}

bool WindowExpr::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const WindowExpr&>(other);
  return func_ == rhs.func_ && partition_by_ == rhs.partition_by_ &&
         order_by_ == rhs.order_by_;
}

std::string WindowExpr::toString(const ExprArena& arena) const {
  std::string res = arena.toString(func_) + ".over(" + arena.toString(partition_by_);
  if (!order_by_.empty()) {
    res += "; order_by=" + arena.toString(order_by_);
  }
  return res + ")";
}

std::unique_ptr<Expr> CastExpr::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), (size_t)1);
  return std::make_unique<CastExpr>(type(), children[0], strict_);
}

size_t CastExpr::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, operand_);
  boost::hash_combine(res, strict_);
  return res;
}

bool CastExpr::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const CastExpr&>(other);
  return operand_ == rhs.operand_ && strict_ == rhs.strict_;
}

std::string CastExpr::toString(const ExprArena& arena) const {
  return arena.toString(operand_) + ".cast(" + type()->toString() +
         (strict_ ? "" : ", non-strict") + ")";
}

std::unique_ptr<Expr> SortKey::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), (size_t)1);
  return std::make_unique<SortKey>(type(), children[0], descending_, nulls_last_);
}

size_t SortKey::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, operand_);
  boost::hash_combine(res, descending_);
  boost::hash_combine(res, nulls_last_);
  return res;
}

bool SortKey::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const SortKey&>(other);
  return operand_ == rhs.operand_ && descending_ == rhs.descending_ &&
         nulls_last_ == rhs.nulls_last_;
}

std::string SortKey::toString(const ExprArena& arena) const {
  return arena.toString(operand_) + (descending_ ? " DESC" : " ASC") +
         (nulls_last_ ? " NULLS LAST" : " NULLS FIRST");
}

std::unique_ptr<Expr> AliasExpr::withChildren(const ExprIdList& children) const {
  CHECK_EQ(children.size(), (size_t)1);
  return std::make_unique<AliasExpr>(type(), children[0], name_);
}

size_t AliasExpr::hash() const {
  auto res = Expr::hash();
  boost::hash_combine(res, operand_);
  boost::hash_combine(res, name_);
  return res;
}

bool AliasExpr::equal(const Expr& other) const {
  if (!Expr::equal(other)) {
    return false;
  }
  auto& rhs = static_cast<const AliasExpr&>(other);
  return operand_ == rhs.operand_ && name_ == rhs.name_;
}

std::string AliasExpr::toString(const ExprArena& arena) const {
  return arena.toString(operand_) + ".alias(" + name_ + ")";
}

ExprId ExprArena::add(std::unique_ptr<Expr> expr) {
  CHECK(expr);
  CHECK(expr->type());
  for (auto child : expr->children()) {
    CHECK_LT(child, exprs_.size());
  }
  auto hash = expr->hash();
  auto range = index_.equal_range(hash);
  for (auto it = range.first; it != range.second; ++it) {
    if (exprs_[it->second]->equal(*expr)) {
      return it->second;
    }
  }
  auto id = static_cast<ExprId>(exprs_.size());
  expr->id_ = id;
  exprs_.emplace_back(std::move(expr));
  index_.emplace(hash, id);
  return id;
}

const Expr* ExprArena::get(ExprId id) const {
  CHECK_LT(id, exprs_.size());
  return exprs_[id].get();
}

ExprId ExprArena::import(const ExprArena& other, ExprId id) {
  if (&other == this) {
    return id;
  }
  auto expr = other.get(id);
  ExprIdList new_children;
  for (auto child : expr->children()) {
    new_children.push_back(import(other, child));
  }
  return add(expr->withChildren(new_children));
}

std::string ExprArena::toString(ExprId id) const {
  return get(id)->toString(*this);
}

std::string ExprArena::toString(const ExprIdList& ids) const {
  std::string res;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) {
      res += ", ";
    }
    res += toString(ids[i]);
  }
  return res;
}

std::string outputName(const ExprArena& arena, ExprId id) {
  auto expr = arena.get(id);
  if (auto alias = expr->as<AliasExpr>()) {
    return alias->name();
  }
  if (auto agg = expr->as<AggExpr>()) {
    if (!agg->hasArg()) {
      return "len";
    }
  }
  auto cols = referencedColumns(arena, id);
  return cols.empty() ? "literal" : cols.front();
}

std::vector<std::string> referencedColumns(const ExprArena& arena, ExprId id) {
  std::vector<std::string> res;
  std::unordered_set<std::string> seen;
  collectColumns(arena, id, res, seen);
  return res;
}

std::vector<std::string> referencedColumns(const ExprArena& arena, const ExprIdList& ids) {
  std::vector<std::string> res;
  std::unordered_set<std::string> seen;
  for (auto id : ids) {
    collectColumns(arena, id, res, seen);
  }
  return res;
}

bool containsAgg(const ExprArena& arena, ExprId id) {
  return anyExpr(arena, id, [](const Expr* expr) { return expr->is<AggExpr>(); });
}

bool containsWindow(const ExprArena& arena, ExprId id) {
  return anyExpr(arena, id, [](const Expr* expr) { return expr->is<WindowExpr>(); });
}

bool isElementwise(const ExprArena& arena, ExprId id) {
  return !anyExpr(arena, id, [](const Expr* expr) {
    switch (expr->kind()) {
      case ExprKind::kAgg:
      case ExprKind::kWindow:
      case ExprKind::kSortKey:
        return true;
      case ExprKind::kFunction:
        return !expr->as<FunctionOper>()->desc()->elementwise;
      default:
        return false;
    }
  });
}

ExprId stripAlias(const ExprArena& arena, ExprId id) {
  while (auto alias = arena.get(id)->as<AliasExpr>()) {
    id = alias->operand();
  }
  return id;
}

ExprIdList splitConjunction(const ExprArena& arena, ExprId id) {
  auto bin_oper = arena.get(id)->as<BinOper>();
  if (bin_oper && bin_oper->opType() == OpType::kAnd) {
    auto res = splitConjunction(arena, bin_oper->leftOperand());
    auto rhs = splitConjunction(arena, bin_oper->rightOperand());
    res.insert(res.end(), rhs.begin(), rhs.end());
    return res;
  }
  return {id};
}

ExprId makeConjunction(ExprArena& arena, const ExprIdList& conjuncts) {
  if (conjuncts.empty()) {
    return kInvalidExprId;
  }
  auto res = conjuncts.front();
  for (size_t i = 1; i < conjuncts.size(); ++i) {
    res = arena.make<BinOper>(
        arena.type(res)->ctx().boolean(), OpType::kAnd, res, conjuncts[i]);
  }
  return res;
}

}  // namespace lqe::ir
