#include "tracing/entity_projection.hpp"
#include "entity/entity.hpp"

namespace xrayot {

bool put_nested(AttributeMap& target, const std::vector<std::string>& keys, AttributeValue value) {
    if (keys.empty()) return false;

    AttributeMap* current = &target;
    std::shared_ptr<AttributeMap> holder;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        holder = current->child(keys[i]);
        current = holder.get();
    }
    current->put(keys.back(), std::move(value));
    return true;
}

bool project_tag(Entity& entity, const TagDestination& dest, AttributeValue value) {
    switch (dest.target) {
        case TagTarget::ANNOTATIONS:
            return put_nested(entity.annotations(), dest.keys, std::move(value));
        case TagTarget::AWS:
            return put_nested(entity.aws(), dest.keys, std::move(value));
        case TagTarget::HTTP:
            return put_nested(entity.http(), dest.keys, std::move(value));
        case TagTarget::SQL:
            return put_nested(entity.sql(), dest.keys, std::move(value));
        case TagTarget::SERVICE:
            // Service information only exists on root segments
            if (!entity.is_segment()) return false;
            return put_nested(static_cast<Segment&>(entity).service(), dest.keys, std::move(value));
        case TagTarget::METADATA: {
            if (dest.keys.empty()) return false;
            const auto ns = entity.metadata().child(dest.metadata_namespace);
            return put_nested(*ns, dest.keys, std::move(value));
        }
    }
    return false;
}

} // namespace xrayot
