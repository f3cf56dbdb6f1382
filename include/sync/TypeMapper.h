#ifndef TYPEMAPPER_H
#define TYPEMAPPER_H

#include "core/Config.h"
#include "engines/data_record.h"
#include <string>
#include <vector>

// Coarse classes of MySQL column types. Order mirrors the order in which the
// classification rules are checked.
enum class MySqlTypeClass {
  Enum,
  Set,
  Json,
  Spatial,
  DateTime,
  Date,
  Time,
  Year,
  Boolean,
  BigInt,
  Int,
  MediumInt,
  SmallInt,
  TinyInt,
  Decimal,
  Float,
  Double,
  Bit,
  Binary,
  Char,
  Text,
  Unknown
};

struct MySqlTypeInfo {
  MySqlTypeClass typeClass = MySqlTypeClass::Unknown;
  std::string baseName;
  bool isUnsigned = false;
  // First number inside the parentheses, 0 when absent.
  int length = 0;
};

enum class EsTypeClass {
  Integer,
  Float,
  Boolean,
  Date,
  Keyword,
  Text,
  Structured,
  Binary,
  Unknown
};

struct TypeMapping {
  std::string type;
  // False when the source type was not recognised and a string-like default
  // was chosen.
  bool known = true;
};

// Stateless conversions between MySQL and Elasticsearch types and values.
// Every function is safe to call from any worker thread.
class TypeMapper {
public:
  static MySqlTypeInfo classifyMySQL(const std::string &columnType);
  static EsTypeClass classifyElasticsearch(const std::string &fieldType);

  static TypeMapping mysqlToElasticsearch(const std::string &columnType);
  static TypeMapping elasticsearchToMysql(const std::string &fieldType);

  // Dispatches on the side the type comes from.
  static TypeMapping toDestinationType(const std::string &sourceNativeType,
                                       EndpointKind sourceKind);

  // Maps every column; names of columns whose type was unknown are appended
  // to unknownColumns when it is not null.
  static Schema toDestinationSchema(const Schema &source,
                                    EndpointKind sourceKind,
                                    std::vector<std::string> *unknownColumns);

  // Converts one value read from a column of sourceType. Throws DataError
  // when the value cannot be represented on the other side.
  static FieldValue mapValue(const FieldValue &value,
                             const std::string &sourceType,
                             EndpointKind sourceKind);

  // Converts every field that belongs to sourceSchema and derives the
  // document id / primary key value for the destination.
  static Record mapRecord(const Record &record, const Schema &sourceSchema,
                          const Schema &destinationSchema,
                          EndpointKind sourceKind);

  static std::string primaryKeyToDocumentId(const FieldValue &pkValue);
  static FieldValue documentIdToPrimaryKey(const std::string &id,
                                           const std::string &targetColumnType);

  static constexpr const char *DOCUMENT_ID_FIELD = "_id";
  static constexpr const char *DOCUMENT_ID_COLUMN_TYPE = "VARCHAR(512)";

private:
  static FieldValue mapRelationalValue(const FieldValue &value,
                                       const MySqlTypeInfo &type);
  static FieldValue mapDocumentValue(const FieldValue &value,
                                     EsTypeClass type);
};

#endif
