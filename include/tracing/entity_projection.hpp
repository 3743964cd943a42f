#pragma once

#include "entity/attribute_map.hpp"
#include "tracing/tag_resolver.hpp"

#include <string>
#include <vector>

namespace xrayot {

class Entity;

/**
 * @brief Write a value into the entity container named by dest
 *
 * Intermediate maps along dest.keys are fetched or created; the last key
 * receives the value, replacing whatever was there (scalar or map).
 * SERVICE on a subsegment and destinations without keys are ignored.
 *
 * @return true if the value was stored
 */
bool project_tag(Entity& entity, const TagDestination& dest, AttributeValue value);

/**
 * @brief Store value at the nested path keys under target
 * @return false if keys is empty
 */
bool put_nested(AttributeMap& target, const std::vector<std::string>& keys, AttributeValue value);

} // namespace xrayot
