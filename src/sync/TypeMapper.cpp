#include "sync/TypeMapper.h"
#include "core/sync_errors.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace {

struct ClassRule {
  const char *baseName;
  MySqlTypeClass typeClass;
};

// Checked top to bottom. Enumerated, structured and spatial types come
// first, then temporal, then the boolean special cases (handled in code
// between the two tables), then integers from the widest down, fixed and
// floating point, binary, and finally the string types.
const ClassRule LEADING_RULES[] = {
    {"enum", MySqlTypeClass::Enum},
    {"set", MySqlTypeClass::Set},
    {"json", MySqlTypeClass::Json},
    {"geometry", MySqlTypeClass::Spatial},
    {"point", MySqlTypeClass::Spatial},
    {"linestring", MySqlTypeClass::Spatial},
    {"polygon", MySqlTypeClass::Spatial},
    {"multipoint", MySqlTypeClass::Spatial},
    {"multilinestring", MySqlTypeClass::Spatial},
    {"multipolygon", MySqlTypeClass::Spatial},
    {"geometrycollection", MySqlTypeClass::Spatial},
    {"geomcollection", MySqlTypeClass::Spatial},
    {"datetime", MySqlTypeClass::DateTime},
    {"timestamp", MySqlTypeClass::DateTime},
    {"date", MySqlTypeClass::Date},
    {"time", MySqlTypeClass::Time},
    {"year", MySqlTypeClass::Year},
};

const ClassRule TRAILING_RULES[] = {
    {"bool", MySqlTypeClass::Boolean},
    {"boolean", MySqlTypeClass::Boolean},
    {"bigint", MySqlTypeClass::BigInt},
    {"int", MySqlTypeClass::Int},
    {"integer", MySqlTypeClass::Int},
    {"mediumint", MySqlTypeClass::MediumInt},
    {"smallint", MySqlTypeClass::SmallInt},
    {"tinyint", MySqlTypeClass::TinyInt},
    {"decimal", MySqlTypeClass::Decimal},
    {"dec", MySqlTypeClass::Decimal},
    {"numeric", MySqlTypeClass::Decimal},
    {"fixed", MySqlTypeClass::Decimal},
    {"float", MySqlTypeClass::Float},
    {"double", MySqlTypeClass::Double},
    {"real", MySqlTypeClass::Double},
    {"bit", MySqlTypeClass::Bit},
    {"binary", MySqlTypeClass::Binary},
    {"varbinary", MySqlTypeClass::Binary},
    {"tinyblob", MySqlTypeClass::Binary},
    {"blob", MySqlTypeClass::Binary},
    {"mediumblob", MySqlTypeClass::Binary},
    {"longblob", MySqlTypeClass::Binary},
    {"char", MySqlTypeClass::Char},
    {"varchar", MySqlTypeClass::Char},
    {"nchar", MySqlTypeClass::Char},
    {"nvarchar", MySqlTypeClass::Char},
    {"tinytext", MySqlTypeClass::Text},
    {"text", MySqlTypeClass::Text},
    {"mediumtext", MySqlTypeClass::Text},
    {"longtext", MySqlTypeClass::Text},
};

int64_t parseInteger(const std::string &text) {
  std::string trimmed = StringUtils::trim(text);
  if (!StringUtils::isSignedInteger(trimmed))
    throw DataError("'" + text + "' is not an integer");
  errno = 0;
  long long v = std::strtoll(trimmed.c_str(), nullptr, 10);
  if (errno == ERANGE)
    throw DataError("'" + text + "' is out of the 64-bit integer range");
  return static_cast<int64_t>(v);
}

double parseDouble(const std::string &text) {
  std::string trimmed = StringUtils::trim(text);
  if (trimmed.empty())
    throw DataError("empty string is not a number");
  char *end = nullptr;
  errno = 0;
  double v = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size())
    throw DataError("'" + text + "' is not a number");
  if (errno == ERANGE && std::isinf(v))
    throw DataError("'" + text + "' overflows a double");
  return v;
}

bool parseBoolean(const std::string &text) {
  std::string lower = StringUtils::toLower(StringUtils::trim(text));
  if (lower == "true" || lower == "1")
    return true;
  if (lower == "false" || lower == "0")
    return false;
  throw DataError("'" + text + "' is not a boolean");
}

int64_t integralFromDouble(double d) {
  if (!std::isfinite(d) || std::floor(d) != d ||
      d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
      d >= static_cast<double>(std::numeric_limits<int64_t>::max()))
    throw DataError("float value " + nlohmann::json(d).dump() +
                    " has no exact integer representation");
  return static_cast<int64_t>(d);
}

FieldValue toStringValue(const FieldValue &value) {
  switch (value.kind()) {
  case FieldKind::String:
    return value;
  case FieldKind::Bytes:
    return FieldValue::string(value.asBytes());
  case FieldKind::Object:
    return FieldValue::string(value.asObject().dump());
  case FieldKind::Timestamp:
    return FieldValue::string(
        TimeUtils::formatDateTimeMicros(value.asTimestamp(), ' ', false));
  default:
    return FieldValue::string(value.toDisplayString());
  }
}

FieldValue timestampFromText(const std::string &text) {
  auto micros = TimeUtils::parseDateTimeMicros(StringUtils::trim(text));
  if (!micros)
    throw DataError("'" + text + "' is not a valid date/time");
  return FieldValue::timestamp(*micros);
}

} // namespace

MySqlTypeInfo TypeMapper::classifyMySQL(const std::string &columnType) {
  MySqlTypeInfo info;
  std::string normalized = StringUtils::toLower(StringUtils::trim(columnType));

  size_t baseEnd = normalized.find_first_of("( ");
  info.baseName = normalized.substr(0, baseEnd);
  info.isUnsigned = normalized.find(" unsigned") != std::string::npos;

  size_t open = normalized.find('(');
  if (open != std::string::npos) {
    size_t pos = open + 1;
    while (pos < normalized.size() &&
           std::isdigit(static_cast<unsigned char>(normalized[pos]))) {
      info.length = info.length * 10 + (normalized[pos] - '0');
      ++pos;
    }
  }

  for (const auto &rule : LEADING_RULES) {
    if (info.baseName == rule.baseName) {
      info.typeClass = rule.typeClass;
      return info;
    }
  }

  // TINYINT(1) and BIT(1) hold flags, everything wider is numeric.
  if ((info.baseName == "tinyint" || info.baseName == "bit") &&
      info.length == 1) {
    info.typeClass = MySqlTypeClass::Boolean;
    return info;
  }

  // "double precision" has a space in its base name.
  if (StringUtils::startsWith(normalized, "double precision")) {
    info.baseName = "double";
  }

  for (const auto &rule : TRAILING_RULES) {
    if (info.baseName == rule.baseName) {
      info.typeClass = rule.typeClass;
      return info;
    }
  }

  info.typeClass = MySqlTypeClass::Unknown;
  return info;
}

EsTypeClass TypeMapper::classifyElasticsearch(const std::string &fieldType) {
  std::string type = StringUtils::toLower(StringUtils::trim(fieldType));
  if (type == "long" || type == "integer" || type == "short" ||
      type == "byte" || type == "unsigned_long")
    return EsTypeClass::Integer;
  if (type == "double" || type == "float" || type == "half_float" ||
      type == "scaled_float")
    return EsTypeClass::Float;
  if (type == "boolean")
    return EsTypeClass::Boolean;
  if (type == "date" || type == "date_nanos")
    return EsTypeClass::Date;
  if (type == "keyword" || type == "constant_keyword" || type == "wildcard" ||
      type == "ip" || type == "version")
    return EsTypeClass::Keyword;
  if (type == "text" || type == "match_only_text")
    return EsTypeClass::Text;
  if (type == "object" || type == "nested" || type == "flattened" ||
      type == "geo_point" || type == "geo_shape" || type == "point" ||
      type == "shape" || type == "dense_vector" || type == "join" ||
      StringUtils::endsWith(type, "_range"))
    return EsTypeClass::Structured;
  if (type == "binary")
    return EsTypeClass::Binary;
  return EsTypeClass::Unknown;
}

TypeMapping TypeMapper::mysqlToElasticsearch(const std::string &columnType) {
  MySqlTypeInfo info = classifyMySQL(columnType);
  switch (info.typeClass) {
  case MySqlTypeClass::Enum:
  case MySqlTypeClass::Set:
  case MySqlTypeClass::Char:
  case MySqlTypeClass::Time:
    return {"keyword", true};
  case MySqlTypeClass::Json:
    return {"object", true};
  case MySqlTypeClass::Spatial:
    return {"geo_shape", true};
  case MySqlTypeClass::DateTime:
  case MySqlTypeClass::Date:
    return {"date", true};
  case MySqlTypeClass::Year:
    return {"short", true};
  case MySqlTypeClass::Boolean:
    return {"boolean", true};
  case MySqlTypeClass::BigInt:
    return {info.isUnsigned ? "unsigned_long" : "long", true};
  case MySqlTypeClass::Int:
    return {info.isUnsigned ? "long" : "integer", true};
  case MySqlTypeClass::MediumInt:
    return {"integer", true};
  case MySqlTypeClass::SmallInt:
    return {info.isUnsigned ? "integer" : "short", true};
  case MySqlTypeClass::TinyInt:
    return {info.isUnsigned ? "short" : "byte", true};
  case MySqlTypeClass::Decimal:
  case MySqlTypeClass::Double:
    return {"double", true};
  case MySqlTypeClass::Float:
    return {"float", true};
  case MySqlTypeClass::Bit:
    return {"long", true};
  case MySqlTypeClass::Binary:
    return {"binary", true};
  case MySqlTypeClass::Text:
    return {"text", true};
  case MySqlTypeClass::Unknown:
    break;
  }
  return {"keyword", false};
}

TypeMapping TypeMapper::elasticsearchToMysql(const std::string &fieldType) {
  std::string type = StringUtils::toLower(StringUtils::trim(fieldType));
  if (type == "long")
    return {"BIGINT", true};
  if (type == "unsigned_long")
    return {"BIGINT UNSIGNED", true};
  if (type == "integer")
    return {"INT", true};
  if (type == "short")
    return {"SMALLINT", true};
  if (type == "byte")
    return {"TINYINT", true};
  if (type == "double" || type == "scaled_float")
    return {"DOUBLE", true};
  if (type == "float" || type == "half_float")
    return {"FLOAT", true};
  if (type == "boolean")
    return {"TINYINT(1)", true};
  if (type == "date" || type == "date_nanos")
    return {"DATETIME(6)", true};
  if (type == "ip")
    return {"VARCHAR(45)", true};

  switch (classifyElasticsearch(type)) {
  case EsTypeClass::Keyword:
    return {"VARCHAR(255)", true};
  case EsTypeClass::Text:
    return {"LONGTEXT", true};
  case EsTypeClass::Structured:
    return {"JSON", true};
  case EsTypeClass::Binary:
    return {"LONGBLOB", true};
  default:
    break;
  }
  return {"LONGTEXT", false};
}

TypeMapping TypeMapper::toDestinationType(const std::string &sourceNativeType,
                                          EndpointKind sourceKind) {
  return sourceKind == EndpointKind::MySQL
             ? mysqlToElasticsearch(sourceNativeType)
             : elasticsearchToMysql(sourceNativeType);
}

Schema TypeMapper::toDestinationSchema(const Schema &source,
                                       EndpointKind sourceKind,
                                       std::vector<std::string> *unknownColumns) {
  Schema destination;
  destination.unitName = source.unitName;

  if (sourceKind == EndpointKind::MySQL) {
    destination.primaryKey = source.primaryKey;
    for (const auto &column : source.columns) {
      TypeMapping mapping = mysqlToElasticsearch(column.nativeType);
      if (!mapping.known && unknownColumns)
        unknownColumns->push_back(column.name);
      destination.columns.push_back(
          {column.name, mapping.type, column.nullable, column.isPrimaryKey});
    }
    return destination;
  }

  // Documents become rows keyed by their id.
  destination.primaryKey = DOCUMENT_ID_FIELD;
  destination.charset = source.charset;
  destination.collation = source.collation;
  destination.columns.push_back(
      {DOCUMENT_ID_FIELD, DOCUMENT_ID_COLUMN_TYPE, false, true});
  for (const auto &column : source.columns) {
    if (column.name == DOCUMENT_ID_FIELD)
      continue;
    TypeMapping mapping = elasticsearchToMysql(column.nativeType);
    if (!mapping.known && unknownColumns)
      unknownColumns->push_back(column.name);
    destination.columns.push_back({column.name, mapping.type, true, false});
  }
  return destination;
}

FieldValue TypeMapper::mapValue(const FieldValue &value,
                                const std::string &sourceType,
                                EndpointKind sourceKind) {
  if (value.isNull())
    return value;
  if (sourceKind == EndpointKind::MySQL)
    return mapRelationalValue(value, classifyMySQL(sourceType));
  return mapDocumentValue(value, classifyElasticsearch(sourceType));
}

// MySQL value -> Elasticsearch value.
FieldValue TypeMapper::mapRelationalValue(const FieldValue &value,
                                          const MySqlTypeInfo &type) {
  FieldKind kind = value.kind();
  switch (type.typeClass) {
  case MySqlTypeClass::Enum:
  case MySqlTypeClass::Set:
  case MySqlTypeClass::Char:
  case MySqlTypeClass::Text:
  case MySqlTypeClass::Time:
  case MySqlTypeClass::Unknown:
    return toStringValue(value);

  case MySqlTypeClass::Json:
  case MySqlTypeClass::Spatial:
    if (kind == FieldKind::Object)
      return value;
    if (kind == FieldKind::String || kind == FieldKind::Bytes) {
      const std::string &text =
          kind == FieldKind::String ? value.asString() : value.asBytes();
      try {
        return FieldValue::object(nlohmann::json::parse(text));
      } catch (const nlohmann::json::parse_error &e) {
        throw DataError(std::string("invalid JSON document: ") + e.what());
      }
    }
    break;

  case MySqlTypeClass::DateTime:
  case MySqlTypeClass::Date:
    if (kind == FieldKind::Timestamp)
      return value;
    if (kind == FieldKind::String)
      return timestampFromText(value.asString());
    break;

  case MySqlTypeClass::Boolean:
    if (kind == FieldKind::Boolean)
      return value;
    if (kind == FieldKind::Integer)
      return FieldValue::boolean(value.asInteger() != 0);
    if (kind == FieldKind::String)
      return FieldValue::boolean(parseBoolean(value.asString()));
    if (kind == FieldKind::Bytes) {
      bool set = false;
      for (char c : value.asBytes())
        set = set || c != 0;
      return FieldValue::boolean(set);
    }
    break;

  case MySqlTypeClass::Year:
  case MySqlTypeClass::BigInt:
  case MySqlTypeClass::Int:
  case MySqlTypeClass::MediumInt:
  case MySqlTypeClass::SmallInt:
  case MySqlTypeClass::TinyInt:
    if (kind == FieldKind::Integer)
      return value;
    if (kind == FieldKind::Boolean)
      return FieldValue::integer(value.asBoolean() ? 1 : 0);
    if (kind == FieldKind::Float)
      return FieldValue::integer(integralFromDouble(value.asFloat()));
    if (kind == FieldKind::String) {
      // BIGINT UNSIGNED above INT64_MAX stays textual; unsigned_long
      // accepts numeric strings.
      if (type.isUnsigned && StringUtils::isUnsignedInteger(
                                 StringUtils::trim(value.asString())) &&
          value.asString().size() >= 19) {
        errno = 0;
        unsigned long long u =
            std::strtoull(value.asString().c_str(), nullptr, 10);
        if (errno != ERANGE &&
            u > static_cast<unsigned long long>(
                    std::numeric_limits<int64_t>::max()))
          return FieldValue::string(std::to_string(u));
      }
      return FieldValue::integer(parseInteger(value.asString()));
    }
    break;

  case MySqlTypeClass::Decimal:
  case MySqlTypeClass::Float:
  case MySqlTypeClass::Double:
    if (kind == FieldKind::Float)
      return value;
    if (kind == FieldKind::Integer)
      return FieldValue::floating(static_cast<double>(value.asInteger()));
    if (kind == FieldKind::String)
      return FieldValue::floating(parseDouble(value.asString()));
    break;

  case MySqlTypeClass::Bit:
    if (kind == FieldKind::Integer)
      return value;
    if (kind == FieldKind::Bytes) {
      const std::string &raw = value.asBytes();
      if (raw.size() > 8)
        throw DataError("BIT value wider than 64 bits");
      uint64_t bits = 0;
      for (char c : raw)
        bits = (bits << 8) | static_cast<unsigned char>(c);
      return FieldValue::integer(static_cast<int64_t>(bits));
    }
    break;

  case MySqlTypeClass::Binary:
    if (kind == FieldKind::Bytes)
      return FieldValue::string(StringUtils::base64Encode(value.asBytes()));
    if (kind == FieldKind::String)
      return FieldValue::string(StringUtils::base64Encode(value.asString()));
    break;
  }

  throw DataError("cannot convert " + fieldKindToString(kind) +
                  " value from MySQL type '" + type.baseName + "'");
}

// Elasticsearch value -> MySQL value.
FieldValue TypeMapper::mapDocumentValue(const FieldValue &value,
                                        EsTypeClass type) {
  FieldKind kind = value.kind();
  switch (type) {
  case EsTypeClass::Integer:
    if (kind == FieldKind::Integer)
      return value;
    if (kind == FieldKind::Float)
      return FieldValue::integer(integralFromDouble(value.asFloat()));
    if (kind == FieldKind::Boolean)
      return FieldValue::integer(value.asBoolean() ? 1 : 0);
    if (kind == FieldKind::String)
      return FieldValue::integer(parseInteger(value.asString()));
    break;

  case EsTypeClass::Float:
    if (kind == FieldKind::Float)
      return value;
    if (kind == FieldKind::Integer)
      return FieldValue::floating(static_cast<double>(value.asInteger()));
    if (kind == FieldKind::String)
      return FieldValue::floating(parseDouble(value.asString()));
    break;

  case EsTypeClass::Boolean:
    if (kind == FieldKind::Boolean)
      return value;
    if (kind == FieldKind::Integer)
      return FieldValue::boolean(value.asInteger() != 0);
    if (kind == FieldKind::String)
      return FieldValue::boolean(parseBoolean(value.asString()));
    break;

  case EsTypeClass::Date:
    if (kind == FieldKind::Timestamp)
      return value;
    if (kind == FieldKind::Integer)
      return FieldValue::timestamp(value.asInteger() * 1000);
    if (kind == FieldKind::Float)
      return FieldValue::timestamp(
          static_cast<int64_t>(std::llround(value.asFloat() * 1000.0)));
    if (kind == FieldKind::String) {
      std::string text = StringUtils::trim(value.asString());
      if (StringUtils::isSignedInteger(text))
        return FieldValue::timestamp(parseInteger(text) * 1000);
      return timestampFromText(text);
    }
    break;

  case EsTypeClass::Keyword:
  case EsTypeClass::Text:
  case EsTypeClass::Unknown:
    return toStringValue(value);

  case EsTypeClass::Structured:
    if (kind == FieldKind::Object)
      return value;
    return FieldValue::object(fieldValueToJson(value));

  case EsTypeClass::Binary:
    if (kind == FieldKind::Bytes)
      return value;
    if (kind == FieldKind::String) {
      try {
        return FieldValue::bytes(StringUtils::base64Decode(value.asString()));
      } catch (const std::invalid_argument &e) {
        throw DataError(std::string("binary field: ") + e.what());
      }
    }
    break;
  }

  throw DataError("cannot convert " + fieldKindToString(kind) +
                  " value into a MySQL column");
}

Record TypeMapper::mapRecord(const Record &record, const Schema &sourceSchema,
                             const Schema &destinationSchema,
                             EndpointKind sourceKind) {
  Record mapped;
  mapped.fields.reserve(record.fields.size() + 1);

  if (sourceKind == EndpointKind::Elasticsearch) {
    const Column *idColumn = destinationSchema.findColumn(DOCUMENT_ID_FIELD);
    mapped.fields.emplace_back(
        DOCUMENT_ID_FIELD,
        documentIdToPrimaryKey(record.documentId,
                               idColumn ? idColumn->nativeType
                                        : DOCUMENT_ID_COLUMN_TYPE));
    mapped.documentId = record.documentId;
  }

  for (const auto &field : record.fields) {
    if (sourceKind == EndpointKind::Elasticsearch &&
        field.first == DOCUMENT_ID_FIELD)
      continue;
    const Column *column = sourceSchema.findColumn(field.first);
    if (!column) {
      mapped.fields.push_back(field);
      continue;
    }
    try {
      mapped.fields.emplace_back(
          field.first, mapValue(field.second, column->nativeType, sourceKind));
    } catch (const DataError &e) {
      throw DataError("field '" + field.first + "': " + e.what());
    }
  }

  if (sourceKind == EndpointKind::MySQL && !sourceSchema.primaryKey.empty()) {
    const FieldValue *pk = record.get(sourceSchema.primaryKey);
    if (pk && !pk->isNull())
      mapped.documentId = primaryKeyToDocumentId(*pk);
  }
  return mapped;
}

std::string TypeMapper::primaryKeyToDocumentId(const FieldValue &pkValue) {
  switch (pkValue.kind()) {
  case FieldKind::Null:
    return "";
  case FieldKind::String:
    return pkValue.asString();
  case FieldKind::Integer:
    return std::to_string(pkValue.asInteger());
  case FieldKind::Float:
    return nlohmann::json(pkValue.asFloat()).dump();
  case FieldKind::Boolean:
    return pkValue.asBoolean() ? "true" : "false";
  case FieldKind::Bytes:
    return StringUtils::base64Encode(pkValue.asBytes());
  case FieldKind::Timestamp:
    return TimeUtils::formatDateTimeMicros(pkValue.asTimestamp(), 'T', true);
  case FieldKind::Object:
    return pkValue.asObject().dump();
  }
  return "";
}

FieldValue TypeMapper::documentIdToPrimaryKey(
    const std::string &id, const std::string &targetColumnType) {
  MySqlTypeInfo type = classifyMySQL(targetColumnType);
  switch (type.typeClass) {
  case MySqlTypeClass::BigInt:
  case MySqlTypeClass::Int:
  case MySqlTypeClass::MediumInt:
  case MySqlTypeClass::SmallInt:
  case MySqlTypeClass::TinyInt:
  case MySqlTypeClass::Year:
  case MySqlTypeClass::Bit:
    // Unsigned keys above INT64_MAX travel as decimal text, as they do
    // when read from the table.
    if (type.isUnsigned && StringUtils::isUnsignedInteger(id)) {
      errno = 0;
      unsigned long long u = std::strtoull(id.c_str(), nullptr, 10);
      if (errno == ERANGE)
        throw DataError("document id '" + id +
                        "' is out of the unsigned 64-bit range");
      if (u > static_cast<unsigned long long>(
                  std::numeric_limits<int64_t>::max()))
        return FieldValue::string(std::to_string(u));
    }
    return FieldValue::integer(parseInteger(id));
  case MySqlTypeClass::Boolean:
    return FieldValue::boolean(parseBoolean(id));
  case MySqlTypeClass::Decimal:
  case MySqlTypeClass::Float:
  case MySqlTypeClass::Double:
    return FieldValue::floating(parseDouble(id));
  case MySqlTypeClass::DateTime:
  case MySqlTypeClass::Date:
    return timestampFromText(id);
  case MySqlTypeClass::Binary:
    try {
      return FieldValue::bytes(StringUtils::base64Decode(id));
    } catch (const std::invalid_argument &e) {
      throw DataError(std::string("document id: ") + e.what());
    }
  default:
    break;
  }
  return FieldValue::string(id);
}
