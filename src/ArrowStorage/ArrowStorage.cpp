/**
 * Copyright (C) 2023 Intel Corporation
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ArrowStorage.h"
#include "ArrowUtil.h"

#include "IR/Exception.h"
#include "Logger/Logger.h"
#include "Shared/ThreadPool.h"
#include "Shared/measure.h"

#include <limits>

namespace lqe {

namespace {

constexpr int64_t kMicrosPerDay = 86'400'000'000LL;
constexpr int64_t kMillisPerDay = 86'400'000LL;

int64_t floorDiv(int64_t val, int64_t div) {
  auto res = val / div;
  return (val % div && val < 0) ? res - 1 : res;
}

template <typename ArrowArrayType>
void appendIntValues(const arrow::Array& arr,
                     ColumnBuilder& builder,
                     int64_t mul = 1,
                     int64_t div = 1) {
  auto& typed_arr = static_cast<const ArrowArrayType&>(arr);
  for (int64_t i = 0; i < arr.length(); ++i) {
    if (arr.IsNull(i)) {
      builder.appendNull();
    } else {
      auto val = static_cast<int64_t>(typed_arr.Value(i));
      builder.appendInt(floorDiv(val * mul, div));
    }
  }
}

template <typename ArrowArrayType>
void appendFpValues(const arrow::Array& arr, ColumnBuilder& builder) {
  auto& typed_arr = static_cast<const ArrowArrayType&>(arr);
  for (int64_t i = 0; i < arr.length(); ++i) {
    if (arr.IsNull(i)) {
      builder.appendNull();
    } else {
      builder.appendFp(static_cast<double>(typed_arr.Value(i)));
    }
  }
}

template <typename ArrowArrayType>
void appendStrValues(const arrow::Array& arr, ColumnBuilder& builder) {
  auto& typed_arr = static_cast<const ArrowArrayType&>(arr);
  for (int64_t i = 0; i < arr.length(); ++i) {
    if (arr.IsNull(i)) {
      builder.appendNull();
    } else {
      builder.appendStr(typed_arr.GetString(i));
    }
  }
}

void appendArrowValues(const arrow::Array& arr, ColumnBuilder& builder);

template <typename ArrowArrayType>
void appendListValues(const arrow::Array& arr, ColumnBuilder& builder) {
  auto& typed_arr = static_cast<const ArrowArrayType&>(arr);
  for (int64_t i = 0; i < arr.length(); ++i) {
    if (arr.IsNull(i)) {
      builder.appendNull();
    } else {
      appendArrowValues(*typed_arr.value_slice(i), builder.childBuilder());
      builder.finishListRow();
    }
  }
}

void appendDictionaryValues(const arrow::Array& arr, ColumnBuilder& builder) {
  auto& dict_arr = static_cast<const arrow::DictionaryArray&>(arr);
  auto dict = dict_arr.dictionary();
  if (dict->type_id() != arrow::Type::STRING) {
    throw ir::SchemaError() << "Unsupported Arrow dictionary value type: "
                            << dict->type()->ToString();
  }
  auto& str_dict = static_cast<const arrow::StringArray&>(*dict);
  for (int64_t i = 0; i < arr.length(); ++i) {
    if (arr.IsNull(i)) {
      builder.appendNull();
    } else {
      builder.appendStr(str_dict.GetString(dict_arr.GetValueIndex(i)));
    }
  }
}

void appendUInt64Values(const arrow::Array& arr, ColumnBuilder& builder) {
  auto& typed_arr = static_cast<const arrow::UInt64Array&>(arr);
  for (int64_t i = 0; i < arr.length(); ++i) {
    if (arr.IsNull(i)) {
      builder.appendNull();
      continue;
    }
    auto val = typed_arr.Value(i);
    if (val > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw ir::ComputeError() << "UInt64 value " << val << " does not fit into int64";
    }
    builder.appendInt(static_cast<int64_t>(val));
  }
}

void appendArrowValues(const arrow::Array& arr, ColumnBuilder& builder) {
  switch (arr.type_id()) {
    case arrow::Type::NA:
      for (int64_t i = 0; i < arr.length(); ++i) {
        builder.appendNull();
      }
      break;
    case arrow::Type::BOOL:
      appendIntValues<arrow::BooleanArray>(arr, builder);
      break;
    case arrow::Type::INT8:
      appendIntValues<arrow::Int8Array>(arr, builder);
      break;
    case arrow::Type::INT16:
      appendIntValues<arrow::Int16Array>(arr, builder);
      break;
    case arrow::Type::INT32:
      appendIntValues<arrow::Int32Array>(arr, builder);
      break;
    case arrow::Type::INT64:
      appendIntValues<arrow::Int64Array>(arr, builder);
      break;
    case arrow::Type::UINT8:
      appendIntValues<arrow::UInt8Array>(arr, builder);
      break;
    case arrow::Type::UINT16:
      appendIntValues<arrow::UInt16Array>(arr, builder);
      break;
    case arrow::Type::UINT32:
      appendIntValues<arrow::UInt32Array>(arr, builder);
      break;
    case arrow::Type::UINT64:
      appendUInt64Values(arr, builder);
      break;
    case arrow::Type::FLOAT:
      appendFpValues<arrow::FloatArray>(arr, builder);
      break;
    case arrow::Type::DOUBLE:
      appendFpValues<arrow::DoubleArray>(arr, builder);
      break;
    case arrow::Type::STRING:
      appendStrValues<arrow::StringArray>(arr, builder);
      break;
    case arrow::Type::LARGE_STRING:
      appendStrValues<arrow::LargeStringArray>(arr, builder);
      break;
    case arrow::Type::DICTIONARY:
      appendDictionaryValues(arr, builder);
      break;
    case arrow::Type::DATE32:
      appendIntValues<arrow::Date32Array>(arr, builder);
      break;
    case arrow::Type::DATE64:
      appendIntValues<arrow::Date64Array>(arr, builder, 1, kMillisPerDay);
      break;
    case arrow::Type::TIMESTAMP:
      switch (static_cast<const arrow::TimestampType&>(*arr.type()).unit()) {
        case arrow::TimeUnit::SECOND:
          appendIntValues<arrow::TimestampArray>(arr, builder, 1'000'000);
          break;
        case arrow::TimeUnit::MILLI:
          appendIntValues<arrow::TimestampArray>(arr, builder, 1'000);
          break;
        case arrow::TimeUnit::MICRO:
          appendIntValues<arrow::TimestampArray>(arr, builder);
          break;
        case arrow::TimeUnit::NANO:
          appendIntValues<arrow::TimestampArray>(arr, builder, 1, 1'000);
          break;
      }
      break;
    case arrow::Type::LIST:
      appendListValues<arrow::ListArray>(arr, builder);
      break;
    case arrow::Type::LARGE_LIST:
      appendListValues<arrow::LargeListArray>(arr, builder);
      break;
    default:
      throw ir::SchemaError() << "Unsupported Arrow type: " << arr.type()->ToString();
  }
}

void appendToArrow(arrow::ArrayBuilder& builder, const Column& col, size_t idx) {
  if (col.isNull(idx)) {
    ARROW_THROW_NOT_OK(builder.AppendNull());
    return;
  }
  auto type = col.type();
  if (type->isNull()) {
    ARROW_THROW_NOT_OK(builder.AppendNull());
  } else if (type->isBoolean()) {
    ARROW_THROW_NOT_OK(
        static_cast<arrow::BooleanBuilder&>(builder).Append(col.intAt(idx) != 0));
  } else if (type->isInt8()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::Int8Builder&>(builder).Append(
        static_cast<int8_t>(col.intAt(idx))));
  } else if (type->isInt16()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::Int16Builder&>(builder).Append(
        static_cast<int16_t>(col.intAt(idx))));
  } else if (type->isInt32()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::Int32Builder&>(builder).Append(
        static_cast<int32_t>(col.intAt(idx))));
  } else if (type->isInt64()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::Int64Builder&>(builder).Append(col.intAt(idx)));
  } else if (type->isFp32()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::FloatBuilder&>(builder).Append(
        static_cast<float>(col.fpAt(idx))));
  } else if (type->isFp64()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::DoubleBuilder&>(builder).Append(col.fpAt(idx)));
  } else if (type->isText()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::StringBuilder&>(builder).Append(col.strAt(idx)));
  } else if (type->isDate()) {
    ARROW_THROW_NOT_OK(static_cast<arrow::Date32Builder&>(builder).Append(
        static_cast<int32_t>(col.intAt(idx))));
  } else if (type->isTimestamp()) {
    ARROW_THROW_NOT_OK(
        static_cast<arrow::TimestampBuilder&>(builder).Append(col.intAt(idx)));
  } else if (type->isList()) {
    auto& list_builder = static_cast<arrow::ListBuilder&>(builder);
    ARROW_THROW_NOT_OK(list_builder.Append());
    auto offset = col.listOffset(idx);
    for (size_t i = 0; i < col.listLength(idx); ++i) {
      appendToArrow(*list_builder.value_builder(), *col.child(), offset + i);
    }
  } else {
    UNREACHABLE() << type->toString();
  }
}

}  // namespace

ArrowStorage::ArrowStorage(SchemaMgrPtr schema_mgr, ConfigPtr config)
    : ctx_(ir::Context::defaultCtx())
    , schema_mgr_(std::move(schema_mgr))
    , config_(config ? std::move(config) : std::make_shared<Config>()) {}

std::shared_ptr<MemoryTable> ArrowStorage::importArrowTable(
    std::shared_ptr<arrow::Table> at,
    const std::string& table_name,
    size_t fragment_size) {
  if (!at) {
    throw ir::InvalidOperationError() << "Cannot import null Arrow table " << table_name;
  }
  if (schema_mgr_ && schema_mgr_->hasTable(table_name)) {
    throw ir::InvalidOperationError() << "Table with name '" << table_name
                                      << "' already exists";
  }
  if (!fragment_size) {
    fragment_size = config_->storage.default_fragment_size;
  }

  Batch batch;
  auto time = measure<>::execution([&]() { batch = fromArrow(*at); });
  VLOG(1) << "Imported Arrow table " << table_name << " (" << batch.numRows()
          << " rows) in " << time << "ms";

  auto res = MemoryTable::fromBatch(batch, fragment_size);
  if (schema_mgr_) {
    schema_mgr_->registerTable(table_name, res);
  }
  return res;
}

void ArrowStorage::dropTable(const std::string& table_name) {
  if (!schema_mgr_) {
    throw ir::InvalidOperationError() << "Cannot drop table '" << table_name
                                      << "': no schema manager is attached";
  }
  schema_mgr_->dropTable(table_name);
}

Batch ArrowStorage::fromArrow(const arrow::Table& at) const {
  std::vector<ir::Field> fields;
  for (auto& field : at.schema()->fields()) {
    fields.push_back({field->name(), getTargetImportType(ctx_, *field->type())});
  }
  ir::Schema schema(fields);

  std::vector<ColumnPtr> columns(fields.size());
  threading::parallel_for_each(
      fields.size(), config_->exec.parallel, [&](size_t col_idx) {
        ColumnBuilder builder(fields[col_idx].type, static_cast<size_t>(at.num_rows()));
        for (auto& chunk : at.column(static_cast<int>(col_idx))->chunks()) {
          appendArrowValues(*chunk, builder);
        }
        columns[col_idx] = builder.finish();
      });

  return Batch(std::move(schema), std::move(columns), static_cast<size_t>(at.num_rows()));
}

std::shared_ptr<arrow::Table> ArrowStorage::toArrow(const Batch& batch) {
  arrow::FieldVector fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  for (size_t col_idx = 0; col_idx < batch.numColumns(); ++col_idx) {
    auto& field = batch.schema()[col_idx];
    auto arrow_type = getArrowExportType(field.type);
    fields.push_back(arrow::field(field.name, arrow_type));

    std::unique_ptr<arrow::ArrayBuilder> builder;
    ARROW_THROW_NOT_OK(arrow::MakeBuilder(arrow::default_memory_pool(), arrow_type, &builder));
    ARROW_THROW_NOT_OK(builder->Reserve(static_cast<int64_t>(batch.numRows())));
    auto& col = *batch.column(col_idx);
    for (size_t i = 0; i < batch.numRows(); ++i) {
      appendToArrow(*builder, col, i);
    }
    std::shared_ptr<arrow::Array> arr;
    ARROW_THROW_NOT_OK(builder->Finish(&arr));
    arrays.push_back(std::move(arr));
  }
  return arrow::Table::Make(
      arrow::schema(fields), arrays, static_cast<int64_t>(batch.numRows()));
}

const ir::Type* ArrowStorage::getTargetImportType(ir::Context& ctx,
                                                  const arrow::DataType& type) {
  switch (type.id()) {
    case arrow::Type::NA:
      return ctx.null();
    case arrow::Type::BOOL:
      return ctx.boolean();
    case arrow::Type::INT8:
      return ctx.int8();
    case arrow::Type::INT16:
    case arrow::Type::UINT8:
      return ctx.int16();
    case arrow::Type::INT32:
    case arrow::Type::UINT16:
      return ctx.int32();
    case arrow::Type::INT64:
    case arrow::Type::UINT32:
    case arrow::Type::UINT64:
      return ctx.int64();
    case arrow::Type::FLOAT:
      return ctx.fp32();
    case arrow::Type::DOUBLE:
      return ctx.fp64();
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return ctx.text();
    case arrow::Type::DICTIONARY: {
      auto& dict_type = static_cast<const arrow::DictionaryType&>(type);
      if (dict_type.value_type()->id() != arrow::Type::STRING) {
        break;
      }
      return ctx.text();
    }
    case arrow::Type::DATE32:
    case arrow::Type::DATE64:
      return ctx.date();
    case arrow::Type::TIMESTAMP:
      return ctx.timestamp();
    case arrow::Type::LIST:
      return ctx.list(getTargetImportType(
          ctx, *static_cast<const arrow::ListType&>(type).value_type()));
    case arrow::Type::LARGE_LIST:
      return ctx.list(getTargetImportType(
          ctx, *static_cast<const arrow::LargeListType&>(type).value_type()));
    default:
      break;
  }
  throw ir::SchemaError() << "Unsupported Arrow type: " << type.ToString();
}

std::shared_ptr<arrow::DataType> ArrowStorage::getArrowExportType(const ir::Type* type) {
  if (type->isNull()) {
    return arrow::null();
  } else if (type->isBoolean()) {
    return arrow::boolean();
  } else if (type->isInt8()) {
    return arrow::int8();
  } else if (type->isInt16()) {
    return arrow::int16();
  } else if (type->isInt32()) {
    return arrow::int32();
  } else if (type->isInt64()) {
    return arrow::int64();
  } else if (type->isFp32()) {
    return arrow::float32();
  } else if (type->isFp64()) {
    return arrow::float64();
  } else if (type->isText()) {
    return arrow::utf8();
  } else if (type->isDate()) {
    return arrow::date32();
  } else if (type->isTimestamp()) {
    return arrow::timestamp(arrow::TimeUnit::MICRO);
  } else if (type->isList()) {
    return arrow::list(getArrowExportType(type->as<ir::ListType>()->elemType()));
  }
  throw ir::SchemaError() << "Cannot export type to Arrow: " << type->toString();
}

}  // namespace lqe
