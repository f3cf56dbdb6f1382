#ifndef DATA_RECORD_H
#define DATA_RECORD_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class FieldKind {
  Null,
  Integer,
  Float,
  Boolean,
  String,
  Bytes,
  Timestamp,
  Object
};

std::string fieldKindToString(FieldKind kind);

struct Bytes {
  std::string data;
  bool operator==(const Bytes &other) const { return data == other.data; }
};

// Microseconds since the Unix epoch, UTC.
struct Timestamp {
  int64_t micros = 0;
  bool operator==(const Timestamp &other) const {
    return micros == other.micros;
  }
};

class FieldValue {
  std::variant<std::monostate, int64_t, double, bool, std::string, Bytes,
               Timestamp, nlohmann::json>
      value_;

public:
  FieldValue() = default;

  static FieldValue null() { return FieldValue(); }
  static FieldValue integer(int64_t v);
  static FieldValue floating(double v);
  static FieldValue boolean(bool v);
  static FieldValue string(std::string v);
  static FieldValue bytes(std::string raw);
  static FieldValue timestamp(int64_t micros);
  static FieldValue object(nlohmann::json v);

  FieldKind kind() const { return static_cast<FieldKind>(value_.index()); }
  bool isNull() const { return kind() == FieldKind::Null; }

  // Accessors throw std::bad_variant_access on a kind mismatch.
  int64_t asInteger() const { return std::get<int64_t>(value_); }
  double asFloat() const { return std::get<double>(value_); }
  bool asBoolean() const { return std::get<bool>(value_); }
  const std::string &asString() const { return std::get<std::string>(value_); }
  const std::string &asBytes() const { return std::get<Bytes>(value_).data; }
  int64_t asTimestamp() const { return std::get<Timestamp>(value_).micros; }
  const nlohmann::json &asObject() const {
    return std::get<nlohmann::json>(value_);
  }

  bool operator==(const FieldValue &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const FieldValue &other) const { return !(*this == other); }

  // Human readable rendering for logs and error context.
  std::string toDisplayString() const;
};

// Field order is preserved as produced by the reader.
struct Record {
  std::vector<std::pair<std::string, FieldValue>> fields;
  // Document id on the search side. Empty for relational rows until the
  // type mapper derives one from the primary key.
  std::string documentId;

  const FieldValue *get(const std::string &name) const;
  void set(const std::string &name, FieldValue value);
  size_t size() const { return fields.size(); }
};

struct Column {
  std::string name;
  std::string nativeType;
  bool nullable = true;
  bool isPrimaryKey = false;
};

struct Schema {
  std::string unitName;
  std::vector<Column> columns;
  // Single primary key column; empty when the unit has none or a composite
  // key.
  std::string primaryKey;
  std::string charset;
  std::string collation;

  const Column *findColumn(const std::string &name) const;
};

// JSON rendering used on the document side: bytes become base64 strings,
// timestamps ISO-8601 UTC strings, non-finite floats null.
nlohmann::json fieldValueToJson(const FieldValue &value);
// Inverse for values found in a document: arrays and objects become Object.
FieldValue fieldValueFromJson(const nlohmann::json &value);

#endif
