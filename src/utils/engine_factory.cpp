#include "utils/engine_factory.h"
#include "core/logger.h"
#include "engines/elasticsearch_engine.h"
#include "engines/mysql_engine.h"

namespace EngineFactory {
std::shared_ptr<IUnitSource> createSource(const EndpointConfig &endpoint) {
  Logger::debug(LogCategory::SYSTEM, "EngineFactory",
                "Source " + endpointKindToString(endpoint.kind) + " at " +
                    endpoint.toSafeString());
  if (endpoint.kind == EndpointKind::MySQL)
    return std::make_shared<MySQLSource>(endpoint);
  return std::make_shared<ElasticsearchSource>(endpoint);
}

std::shared_ptr<IUnitDestination>
createDestination(const EndpointConfig &endpoint) {
  Logger::debug(LogCategory::SYSTEM, "EngineFactory",
                "Destination " + endpointKindToString(endpoint.kind) + " at " +
                    endpoint.toSafeString());
  if (endpoint.kind == EndpointKind::MySQL)
    return std::make_shared<MySQLDestination>(endpoint);
  return std::make_shared<ElasticsearchDestination>(endpoint);
}
} // namespace EngineFactory
