#include "engines/data_record.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <cmath>
#include <limits>

std::string fieldKindToString(FieldKind kind) {
  switch (kind) {
  case FieldKind::Null:
    return "null";
  case FieldKind::Integer:
    return "integer";
  case FieldKind::Float:
    return "float";
  case FieldKind::Boolean:
    return "boolean";
  case FieldKind::String:
    return "string";
  case FieldKind::Bytes:
    return "bytes";
  case FieldKind::Timestamp:
    return "timestamp";
  case FieldKind::Object:
    return "object";
  }
  return "unknown";
}

FieldValue FieldValue::integer(int64_t v) {
  FieldValue f;
  f.value_.emplace<int64_t>(v);
  return f;
}

FieldValue FieldValue::floating(double v) {
  FieldValue f;
  f.value_.emplace<double>(v);
  return f;
}

FieldValue FieldValue::boolean(bool v) {
  FieldValue f;
  f.value_.emplace<bool>(v);
  return f;
}

FieldValue FieldValue::string(std::string v) {
  FieldValue f;
  f.value_.emplace<std::string>(std::move(v));
  return f;
}

FieldValue FieldValue::bytes(std::string raw) {
  FieldValue f;
  f.value_.emplace<Bytes>(Bytes{std::move(raw)});
  return f;
}

FieldValue FieldValue::timestamp(int64_t micros) {
  FieldValue f;
  f.value_.emplace<Timestamp>(Timestamp{micros});
  return f;
}

FieldValue FieldValue::object(nlohmann::json v) {
  FieldValue f;
  f.value_.emplace<nlohmann::json>(std::move(v));
  return f;
}

std::string FieldValue::toDisplayString() const {
  switch (kind()) {
  case FieldKind::Null:
    return "NULL";
  case FieldKind::Integer:
    return std::to_string(asInteger());
  case FieldKind::Float:
    return nlohmann::json(asFloat()).dump();
  case FieldKind::Boolean:
    return asBoolean() ? "true" : "false";
  case FieldKind::String:
    return asString();
  case FieldKind::Bytes:
    return "<" + std::to_string(asBytes().size()) + " bytes>";
  case FieldKind::Timestamp:
    return TimeUtils::formatDateTimeMicros(asTimestamp(), 'T', true);
  case FieldKind::Object:
    return asObject().dump();
  }
  return "";
}

const FieldValue *Record::get(const std::string &name) const {
  for (const auto &field : fields) {
    if (field.first == name)
      return &field.second;
  }
  return nullptr;
}

void Record::set(const std::string &name, FieldValue value) {
  for (auto &field : fields) {
    if (field.first == name) {
      field.second = std::move(value);
      return;
    }
  }
  fields.emplace_back(name, std::move(value));
}

const Column *Schema::findColumn(const std::string &name) const {
  for (const auto &column : columns) {
    if (column.name == name)
      return &column;
  }
  return nullptr;
}

nlohmann::json fieldValueToJson(const FieldValue &value) {
  switch (value.kind()) {
  case FieldKind::Null:
    return nullptr;
  case FieldKind::Integer:
    return value.asInteger();
  case FieldKind::Float: {
    double d = value.asFloat();
    if (!std::isfinite(d))
      return nullptr;
    return d;
  }
  case FieldKind::Boolean:
    return value.asBoolean();
  case FieldKind::String:
    return value.asString();
  case FieldKind::Bytes:
    return StringUtils::base64Encode(value.asBytes());
  case FieldKind::Timestamp:
    return TimeUtils::formatDateTimeMicros(value.asTimestamp(), 'T', true);
  case FieldKind::Object:
    return value.asObject();
  }
  return nullptr;
}

FieldValue fieldValueFromJson(const nlohmann::json &value) {
  if (value.is_null())
    return FieldValue::null();
  if (value.is_boolean())
    return FieldValue::boolean(value.get<bool>());
  if (value.is_number_unsigned()) {
    uint64_t u = value.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      return FieldValue::string(std::to_string(u));
    return FieldValue::integer(static_cast<int64_t>(u));
  }
  if (value.is_number_integer())
    return FieldValue::integer(value.get<int64_t>());
  if (value.is_number_float())
    return FieldValue::floating(value.get<double>());
  if (value.is_string())
    return FieldValue::string(value.get<std::string>());
  return FieldValue::object(value);
}
