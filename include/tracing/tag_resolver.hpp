#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace xrayot {

/**
 * @brief Attribute container a tag is written into
 */
enum class TagTarget {
    ANNOTATIONS,
    AWS,
    HTTP,
    SQL,
    SERVICE,    // root segments only
    METADATA
};

/**
 * @brief Where a flat tag key lives in the entity's attribute tree
 *
 * keys is the nested path inside the container (for METADATA: inside the
 * namespace). An empty keys list means the tag names a container without
 * a field and is not stored.
 */
struct TagDestination {
    TagTarget target = TagTarget::METADATA;
    std::string metadata_namespace;
    std::vector<std::string> keys;
};

/**
 * @brief Maps dot-separated tag keys onto the hierarchical X-Ray layout
 *
 * 1. Rewrite well-known keys through the synonym table
 *    ("db.instance" -> "sql.url", "http.method" -> "http.request.method").
 * 2. The first segment picks the container: annotations, aws, http, sql,
 *    service. Anything else goes to metadata.
 * 3. Metadata keys resolve as:
 *      "foo"                    -> metadata.default.foo
 *      "metadata.foo"           -> metadata.default.foo
 *      "namespace.foo"          -> metadata.namespace.foo
 *      "metadata.namespace.foo" -> metadata.namespace.foo
 *    A lone "metadata" is an ordinary key: metadata.default.metadata.
 *
 * Entity-level tags (error, fault, user, ...) are handled by the span
 * before resolution and never reach this class.
 */
class TagResolver {
public:
    /// Synonym for key, or key itself if it has none
    [[nodiscard]] static std::string_view synonym(std::string_view key);

    [[nodiscard]] static TagDestination resolve(std::string_view key);
};

} // namespace xrayot
