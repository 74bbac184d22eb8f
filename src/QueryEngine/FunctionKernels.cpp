/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ColumnOps.h"

#include "IR/Context.h"
#include "IR/DateTime.h"
#include "IR/Exception.h"
#include "IR/FunctionRegistry.h"
#include "IR/TypeUtils.h"
#include "Logger/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>

namespace lqe::ir {

namespace {

using ColumnList = std::vector<ColumnPtr>;

inline size_t rowIdx(const Column& col, size_t row) {
  return col.size() == 1 ? 0 : row;
}

// Calls fn for rows where all arguments are non-null and appends nulls to
// other rows.
template <typename F>
ColumnPtr mapNonNull(const ColumnList& args, size_t num_rows, const Type* type, F fn) {
  ColumnBuilder builder(type, num_rows);
  for (size_t row = 0; row < num_rows; ++row) {
    bool has_null = false;
    for (auto& arg : args) {
      has_null = has_null || arg->isNull(rowIdx(*arg, row));
    }
    if (has_null) {
      builder.appendNull();
    } else {
      fn(builder, row);
    }
  }
  return builder.finish();
}

const Type* checkNumber(const std::string& name, const Type* type) {
  if (!type->isNumber() && !type->isNull()) {
    throw SchemaError() << "Function '" << name << "' expects a numeric argument, got "
                        << type->toString();
  }
  return type->isNull() ? type->ctx().int64() : type;
}

const Type* checkText(const std::string& name, const Type* type) {
  if (!type->isText() && !type->isNull()) {
    throw SchemaError() << "Function '" << name << "' expects a text argument, got "
                        << type->toString();
  }
  return type->ctx().text();
}

const Type* checkInteger(const std::string& name, const Type* type) {
  if (!type->isInteger()) {
    throw SchemaError() << "Function '" << name
                        << "' expects an integer argument, got " << type->toString();
  }
  return type;
}

const Type* commonOf(const std::string& name, const TypeList& types, size_t first) {
  const Type* res = types[first];
  for (size_t i = first + 1; i < types.size(); ++i) {
    res = commonTypeOrThrow(res, types[i], "function '" + name + "'");
  }
  return res;
}

// Integer amount passed as the second argument of shift-like functions.
int64_t scalarArg(const std::string& name, const ColumnList& args, size_t idx, int64_t def) {
  if (args.size() <= idx) {
    return def;
  }
  auto& arg = *args[idx];
  if (arg.size() != 1 || arg.isNull(0)) {
    throw ComputeError() << "Function '" << name << "' expects a non-null scalar argument "
                         << idx;
  }
  return arg.intAt(0);
}

//
// Math
//

template <typename F>
FunctionDescriptor fpMathFunction(const std::string& name, F fn) {
  FunctionDescriptor desc;
  desc.name = name;
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [name](const TypeList& types) -> const Type* {
    checkNumber(name, types[0]);
    return types[0]->ctx().fp64();
  };
  desc.kernel = [fn](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      builder.appendFp(fn(arg.numAt(rowIdx(arg, row))));
    });
  };
  return desc;
}

// Functions keeping integers as is and applying fn to floating point values.
template <typename F>
FunctionDescriptor roundingFunction(const std::string& name, F fn) {
  FunctionDescriptor desc;
  desc.name = name;
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [name](const TypeList& types) { return checkNumber(name, types[0]); };
  desc.kernel = [fn](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    if (!type->isFloatingPoint()) {
      return cast(broadcast(args[0], num_rows), type, true);
    }
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      builder.appendFp(fn(arg.fpAt(rowIdx(arg, row))));
    });
  };
  return desc;
}

FunctionDescriptor absFunction() {
  FunctionDescriptor desc;
  desc.name = "abs";
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [](const TypeList& types) { return checkNumber("abs", types[0]); };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      auto idx = rowIdx(arg, row);
      if (type->isFloatingPoint()) {
        builder.appendFp(std::fabs(arg.fpAt(idx)));
      } else {
        auto val = arg.intAt(idx);
        builder.appendInt(
            val < 0 ? wrapInteger(static_cast<int64_t>(0 - static_cast<uint64_t>(val)),
                                  type->size())
                    : val);
      }
    });
  };
  return desc;
}

FunctionDescriptor signFunction() {
  FunctionDescriptor desc;
  desc.name = "sign";
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [](const TypeList& types) { return checkNumber("sign", types[0]); };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      auto idx = rowIdx(arg, row);
      if (type->isFloatingPoint()) {
        auto val = arg.fpAt(idx);
        builder.appendFp(std::isnan(val) ? val : (val > 0) - (val < 0));
      } else {
        auto val = arg.intAt(idx);
        builder.appendInt((val > 0) - (val < 0));
      }
    });
  };
  return desc;
}

FunctionDescriptor roundFunction() {
  FunctionDescriptor desc;
  desc.name = "round";
  desc.min_args = 1;
  desc.max_args = 2;
  desc.result_type = [](const TypeList& types) {
    if (types.size() > 1) {
      checkInteger("round", types[1]);
    }
    return checkNumber("round", types[0]);
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    if (!type->isFloatingPoint()) {
      return cast(broadcast(args[0], num_rows), type, true);
    }
    auto decimals = scalarArg("round", args, 1, 0);
    auto scale = std::pow(10.0, static_cast<double>(decimals));
    auto& arg = *args[0];
    return mapNonNull({args[0]}, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      auto val = arg.fpAt(rowIdx(arg, row));
      builder.appendFp(decimals ? std::round(val * scale) / scale : std::round(val));
    });
  };
  return desc;
}

FunctionDescriptor powFunction() {
  FunctionDescriptor desc;
  desc.name = "pow";
  desc.min_args = 2;
  desc.max_args = 2;
  desc.result_type = [](const TypeList& types) -> const Type* {
    checkNumber("pow", types[0]);
    checkNumber("pow", types[1]);
    return types[0]->ctx().fp64();
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& base = *args[0];
    auto& exp = *args[1];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      builder.appendFp(
          std::pow(base.numAt(rowIdx(base, row)), exp.numAt(rowIdx(exp, row))));
    });
  };
  return desc;
}

//
// Strings
//

template <typename F>
FunctionDescriptor textMapFunction(const std::string& name, F fn) {
  FunctionDescriptor desc;
  desc.name = name;
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [name](const TypeList& types) { return checkText(name, types[0]); };
  desc.kernel = [fn](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      builder.appendStr(fn(arg.strAt(rowIdx(arg, row))));
    });
  };
  return desc;
}

std::string toUpper(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return str;
}

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

FunctionDescriptor strLenFunction() {
  FunctionDescriptor desc;
  desc.name = "str_len";
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [](const TypeList& types) -> const Type* {
    checkText("str_len", types[0]);
    return types[0]->ctx().int64();
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      // Counts UTF-8 code points.
      auto& str = arg.strAt(rowIdx(arg, row));
      int64_t len = 0;
      for (unsigned char c : str) {
        len += (c & 0xC0) != 0x80;
      }
      builder.appendInt(len);
    });
  };
  return desc;
}

template <typename F>
FunctionDescriptor textPredicateFunction(const std::string& name, F fn) {
  FunctionDescriptor desc;
  desc.name = name;
  desc.min_args = 2;
  desc.max_args = 2;
  desc.result_type = [name](const TypeList& types) -> const Type* {
    checkText(name, types[0]);
    checkText(name, types[1]);
    return types[0]->ctx().boolean();
  };
  desc.kernel = [fn](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& str = *args[0];
    auto& pattern = *args[1];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      builder.appendInt(
          fn(str.strAt(rowIdx(str, row)), pattern.strAt(rowIdx(pattern, row))));
    });
  };
  return desc;
}

FunctionDescriptor concatStrFunction() {
  FunctionDescriptor desc;
  desc.name = "concat_str";
  desc.min_args = 1;
  desc.max_args = FunctionDescriptor::kVariadic;
  desc.result_type = [](const TypeList& types) -> const Type* {
    for (auto type : types) {
      if (type->isList()) {
        throw SchemaError() << "Function 'concat_str' does not accept list arguments";
      }
    }
    return types[0]->ctx().text();
  };
  desc.arg_types = [](const TypeList& types) {
    return TypeList(types.size(), types[0]->ctx().text());
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      std::string res;
      for (auto& arg : args) {
        res += arg->strAt(rowIdx(*arg, row));
      }
      builder.appendStr(std::move(res));
    });
  };
  return desc;
}

//
// Conditional and null handling
//

FunctionDescriptor ifElseFunction() {
  FunctionDescriptor desc;
  desc.name = "if_else";
  desc.min_args = 3;
  desc.max_args = 3;
  desc.result_type = [](const TypeList& types) {
    if (!types[0]->isBoolean() && !types[0]->isNull()) {
      throw SchemaError() << "Function 'if_else' expects a boolean condition, got "
                          << types[0]->toString();
    }
    return commonOf("if_else", types, 1);
  };
  desc.arg_types = [](const TypeList& types) {
    auto common = commonOf("if_else", types, 1);
    return TypeList{types[0]->ctx().boolean(), common, common};
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& cond = *args[0];
    auto& then_val = *args[1];
    auto& else_val = *args[2];
    ColumnBuilder builder(type, num_rows);
    for (size_t row = 0; row < num_rows; ++row) {
      auto cond_idx = rowIdx(cond, row);
      // A null condition selects the else branch.
      if (!cond.isNull(cond_idx) && cond.intAt(cond_idx)) {
        builder.appendFrom(then_val, rowIdx(then_val, row));
      } else {
        builder.appendFrom(else_val, rowIdx(else_val, row));
      }
    }
    return builder.finish();
  };
  return desc;
}

FunctionDescriptor coalesceFunction(const std::string& name, size_t min_args, size_t max_args) {
  FunctionDescriptor desc;
  desc.name = name;
  desc.min_args = min_args;
  desc.max_args = max_args;
  desc.result_type = [name](const TypeList& types) { return commonOf(name, types, 0); };
  desc.arg_types = [name](const TypeList& types) {
    return TypeList(types.size(), commonOf(name, types, 0));
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    ColumnBuilder builder(type, num_rows);
    for (size_t row = 0; row < num_rows; ++row) {
      bool found = false;
      for (auto& arg : args) {
        auto idx = rowIdx(*arg, row);
        if (!arg->isNull(idx)) {
          builder.appendFrom(*arg, idx);
          found = true;
          break;
        }
      }
      if (!found) {
        builder.appendNull();
      }
    }
    return builder.finish();
  };
  return desc;
}

FunctionDescriptor isInFunction() {
  FunctionDescriptor desc;
  desc.name = "is_in";
  desc.min_args = 2;
  desc.max_args = FunctionDescriptor::kVariadic;
  desc.result_type = [](const TypeList& types) -> const Type* {
    commonOf("is_in", types, 0);
    return types[0]->ctx().boolean();
  };
  desc.arg_types = [](const TypeList& types) {
    return TypeList(types.size(), commonOf("is_in", types, 0));
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& val = *args[0];
    ColumnBuilder builder(type, num_rows);
    for (size_t row = 0; row < num_rows; ++row) {
      auto idx = rowIdx(val, row);
      if (val.isNull(idx)) {
        builder.appendNull();
        continue;
      }
      bool found = false;
      for (size_t i = 1; i < args.size() && !found; ++i) {
        auto& candidate = *args[i];
        auto cand_idx = rowIdx(candidate, row);
        found = !candidate.isNull(cand_idx) && valuesEqual(val, idx, candidate, cand_idx);
      }
      builder.appendInt(found);
    }
    return builder.finish();
  };
  return desc;
}

//
// Temporal
//

template <typename F>
FunctionDescriptor datePartFunction(const std::string& name, F fn) {
  FunctionDescriptor desc;
  desc.name = name;
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [name](const TypeList& types) -> const Type* {
    if (!types[0]->isDateTime() && !types[0]->isNull()) {
      throw SchemaError() << "Function '" << name
                          << "' expects a date or timestamp argument, got "
                          << types[0]->toString();
    }
    return types[0]->ctx().int32();
  };
  desc.kernel = [fn](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    bool is_timestamp = arg.type()->isTimestamp();
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      auto val = arg.intAt(rowIdx(arg, row));
      auto days = is_timestamp ? timestampToDays(val) : val;
      builder.appendInt(fn(civilFromDays(days)));
    });
  };
  return desc;
}

//
// Lists
//

FunctionDescriptor listLenFunction() {
  FunctionDescriptor desc;
  desc.name = "list_len";
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [](const TypeList& types) -> const Type* {
    if (!types[0]->isList()) {
      throw SchemaError() << "Function 'list_len' expects a list argument, got "
                          << types[0]->toString();
    }
    return types[0]->ctx().int64();
  };
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto& arg = *args[0];
    return mapNonNull(args, num_rows, type, [&](ColumnBuilder& builder, size_t row) {
      builder.appendInt(static_cast<int64_t>(arg.listLength(rowIdx(arg, row))));
    });
  };
  return desc;
}

//
// Order dependent functions. Arguments are broadcast to num_rows rows.
//

const Type* cumSumType(const TypeList& types) {
  auto type = types[0];
  if (type->isBoolean() || type->isNull()) {
    return type->ctx().int64();
  }
  checkNumber("cum_sum", type);
  return type->isInteger() ? type->ctx().int64() : type;
}

FunctionDescriptor cumSumFunction() {
  FunctionDescriptor desc;
  desc.name = "cum_sum";
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = cumSumType;
  desc.elementwise = false;
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto arg = broadcast(args[0], num_rows);
    ColumnBuilder builder(type, num_rows);
    int64_t int_sum = 0;
    double fp_sum = 0;
    for (size_t row = 0; row < num_rows; ++row) {
      if (arg->isNull(row)) {
        builder.appendNull();
      } else if (type->isFloatingPoint()) {
        fp_sum += arg->numAt(row);
        builder.appendFp(fp_sum);
      } else {
        int_sum = static_cast<int64_t>(static_cast<uint64_t>(int_sum) +
                                       static_cast<uint64_t>(arg->intAt(row)));
        builder.appendInt(int_sum);
      }
    }
    return builder.finish();
  };
  return desc;
}

FunctionDescriptor cumExtremumFunction(const std::string& name, bool is_max) {
  FunctionDescriptor desc;
  desc.name = name;
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [name](const TypeList& types) -> const Type* {
    if (types[0]->isList() || types[0]->isNull()) {
      throw SchemaError() << "Function '" << name << "' is not supported for "
                          << types[0]->toString();
    }
    return types[0];
  };
  desc.elementwise = false;
  desc.kernel = [is_max](const ColumnList& args, size_t num_rows, const Type* type) {
    auto arg = broadcast(args[0], num_rows);
    ColumnBuilder builder(type, num_rows);
    std::optional<size_t> best;
    for (size_t row = 0; row < num_rows; ++row) {
      if (arg->isNull(row)) {
        builder.appendNull();
        continue;
      }
      if (!best) {
        best = row;
      } else {
        auto cmp = compareValues(*arg, row, *arg, *best);
        if (is_max ? cmp > 0 : cmp < 0) {
          best = row;
        }
      }
      builder.appendFrom(*arg, *best);
    }
    return builder.finish();
  };
  return desc;
}

FunctionDescriptor shiftFunction() {
  FunctionDescriptor desc;
  desc.name = "shift";
  desc.min_args = 1;
  desc.max_args = 2;
  desc.result_type = [](const TypeList& types) {
    if (types.size() > 1) {
      checkInteger("shift", types[1]);
    }
    return types[0];
  };
  desc.elementwise = false;
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type*) {
    auto periods = scalarArg("shift", args, 1, 1);
    auto arg = broadcast(args[0], num_rows);
    std::vector<int64_t> indices(num_rows);
    for (size_t row = 0; row < num_rows; ++row) {
      auto src = static_cast<int64_t>(row) - periods;
      indices[row] = (src < 0 || src >= static_cast<int64_t>(num_rows)) ? -1 : src;
    }
    return take(arg, indices);
  };
  return desc;
}

FunctionDescriptor diffFunction() {
  FunctionDescriptor desc;
  desc.name = "diff";
  desc.min_args = 1;
  desc.max_args = 2;
  desc.result_type = [](const TypeList& types) -> const Type* {
    if (types.size() > 1) {
      checkInteger("diff", types[1]);
    }
    auto type = checkNumber("diff", types[0]);
    return type->isInteger() ? type->ctx().int64() : type;
  };
  desc.elementwise = false;
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto periods = scalarArg("diff", args, 1, 1);
    auto arg = cast(broadcast(args[0], num_rows), type, true);
    std::vector<int64_t> indices(num_rows);
    for (size_t row = 0; row < num_rows; ++row) {
      auto src = static_cast<int64_t>(row) - periods;
      indices[row] = (src < 0 || src >= static_cast<int64_t>(num_rows)) ? -1 : src;
    }
    return binaryOp(OpType::kMinus, arg, take(arg, indices), type);
  };
  return desc;
}

// Ordinal rank: ties get distinct ranks in order of appearance.
FunctionDescriptor rankFunction() {
  FunctionDescriptor desc;
  desc.name = "rank";
  desc.min_args = 1;
  desc.max_args = 1;
  desc.result_type = [](const TypeList& types) -> const Type* {
    if (types[0]->isList()) {
      throw SchemaError() << "Function 'rank' is not supported for "
                          << types[0]->toString();
    }
    return types[0]->ctx().int64();
  };
  desc.elementwise = false;
  desc.kernel = [](const ColumnList& args, size_t num_rows, const Type* type) {
    auto arg = broadcast(args[0], num_rows);
    std::vector<size_t> order;
    for (size_t row = 0; row < num_rows; ++row) {
      if (!arg->isNull(row)) {
        order.push_back(row);
      }
    }
    std::stable_sort(order.begin(), order.end(), [&](size_t lhs, size_t rhs) {
      return compareValues(*arg, lhs, *arg, rhs) < 0;
    });
    std::vector<int64_t> ranks(num_rows, 0);
    for (size_t i = 0; i < order.size(); ++i) {
      ranks[order[i]] = static_cast<int64_t>(i + 1);
    }
    ColumnBuilder builder(type, num_rows);
    for (size_t row = 0; row < num_rows; ++row) {
      if (arg->isNull(row)) {
        builder.appendNull();
      } else {
        builder.appendInt(ranks[row]);
      }
    }
    return builder.finish();
  };
  return desc;
}

}  // namespace

void registerBuiltinFunctions(FunctionRegistry& registry) {
  registry.registerFunction(absFunction());
  registry.registerFunction(fpMathFunction("sqrt", [](double v) { return std::sqrt(v); }));
  registry.registerFunction(fpMathFunction("exp", [](double v) { return std::exp(v); }));
  registry.registerFunction(fpMathFunction("log", [](double v) { return std::log(v); }));
  registry.registerFunction(
      roundingFunction("floor", [](double v) { return std::floor(v); }));
  registry.registerFunction(roundingFunction("ceil", [](double v) { return std::ceil(v); }));
  registry.registerFunction(roundFunction());
  registry.registerFunction(signFunction());
  registry.registerFunction(powFunction());

  registry.registerFunction(textMapFunction("upper", toUpper));
  registry.registerFunction(textMapFunction("lower", toLower));
  registry.registerFunction(strLenFunction());
  registry.registerFunction(textPredicateFunction(
      "contains", [](const std::string& str, const std::string& pattern) {
        return str.find(pattern) != std::string::npos;
      }));
  registry.registerFunction(textPredicateFunction(
      "starts_with", [](const std::string& str, const std::string& prefix) {
        return str.compare(0, prefix.size(), prefix) == 0;
      }));
  registry.registerFunction(textPredicateFunction(
      "ends_with", [](const std::string& str, const std::string& suffix) {
        return str.size() >= suffix.size() &&
               str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
      }));
  registry.registerFunction(concatStrFunction());

  registry.registerFunction(ifElseFunction());
  registry.registerFunction(
      coalesceFunction("coalesce", 1, FunctionDescriptor::kVariadic));
  registry.registerFunction(coalesceFunction("fill_null", 2, 2));
  registry.registerFunction(isInFunction());

  registry.registerFunction(
      datePartFunction("year", [](const CivilDate& date) { return date.year; }));
  registry.registerFunction(datePartFunction(
      "month", [](const CivilDate& date) { return static_cast<int64_t>(date.month); }));
  registry.registerFunction(datePartFunction(
      "day", [](const CivilDate& date) { return static_cast<int64_t>(date.day); }));

  registry.registerFunction(listLenFunction());

  registry.registerFunction(cumSumFunction());
  registry.registerFunction(cumExtremumFunction("cum_max", true));
  registry.registerFunction(cumExtremumFunction("cum_min", false));
  registry.registerFunction(shiftFunction());
  registry.registerFunction(diffFunction());
  registry.registerFunction(rankFunction());
}

const FunctionRegistry& FunctionRegistry::instance() {
  static const FunctionRegistry registry = [] {
    FunctionRegistry res;
    registerBuiltinFunctions(res);
    VLOG(1) << "Registered " << res.size() << " built-in functions.";
    return res;
  }();
  return registry;
}

}  // namespace lqe::ir
