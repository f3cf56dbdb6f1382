#ifndef ENGINE_FACTORY_H
#define ENGINE_FACTORY_H

#include "core/Config.h"
#include "engines/database_engine.h"
#include <memory>

namespace EngineFactory {
// Builds the source side of a task for the endpoint's kind. Nothing is
// contacted until the engine pings it.
std::shared_ptr<IUnitSource> createSource(const EndpointConfig &endpoint);
std::shared_ptr<IUnitDestination>
createDestination(const EndpointConfig &endpoint);
} // namespace EngineFactory

#endif
