#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace xrayot {

/**
 * @brief Tag key bound to a value type, for the typed set_tag forms
 */
template<typename T>
struct Tag {
    std::string_view key;
};

using StringTag = Tag<std::string>;
using BooleanTag = Tag<bool>;
using IntTag = Tag<int64_t>;

namespace tags {

// ---- Standard tracing conventions -------------------------------------------

inline constexpr BooleanTag ERROR{"error"};
inline constexpr StringTag DB_INSTANCE{"db.instance"};
inline constexpr StringTag DB_STATEMENT{"db.statement"};
inline constexpr StringTag DB_TYPE{"db.type"};
inline constexpr StringTag DB_USER{"db.user"};
inline constexpr StringTag HTTP_METHOD{"http.method"};
inline constexpr IntTag HTTP_STATUS{"http.status_code"};
inline constexpr StringTag HTTP_URL{"http.url"};

// ---- Extra conventions ------------------------------------------------------

/// Software version of the running application
inline constexpr StringTag VERSION{"version"};
/// Client-side database driver name / version
inline constexpr StringTag DB_DRIVER{"db.driver"};
/// Database server version
inline constexpr StringTag DB_VERSION{"db.version"};
inline constexpr StringTag HTTP_CLIENT_IP{"http.client_ip"};
inline constexpr StringTag HTTP_USER_AGENT{"http.user_agent"};
inline constexpr IntTag HTTP_CONTENT_LENGTH{"http.content_length"};

// ---- X-Ray entity-level tags ------------------------------------------------
// Applied directly to the entity instead of an attribute container.

/// Non-recoverable failure
inline constexpr BooleanTag FAULT{"fault"};
/// Request was throttled
inline constexpr BooleanTag THROTTLE{"throttle"};
/// Sampling decision (root spans only)
inline constexpr BooleanTag IS_SAMPLED{"isSampled"};
/// Requesting user (root spans only)
inline constexpr StringTag USER{"user"};
/// AWS resource type, e.g. "AWS::EC2::Instance" (root spans only)
inline constexpr StringTag ORIGIN{"origin"};
/// Overrides the id of the parent entity
inline constexpr StringTag PARENT_ID{"parentId"};

} // namespace tags

/**
 * @brief Metadata namespaces used by the tracer
 *
 * Tags that do not land in a dedicated container are stored as
 * metadata.<namespace>.<key...>; "foo" -> metadata.default.foo,
 * "widget.bar" -> metadata.widget.bar.
 */
namespace metadata_namespaces {

inline constexpr std::string_view DEFAULT = "default";
inline constexpr std::string_view LOG = "log";

} // namespace metadata_namespaces

/**
 * @brief Well-known log field names
 */
namespace log_fields {

inline constexpr std::string_view EVENT = "event";
inline constexpr std::string_view MESSAGE = "message";
inline constexpr std::string_view ERROR_KIND = "error.kind";
inline constexpr std::string_view ERROR_OBJECT = "error.object";

} // namespace log_fields

} // namespace xrayot
