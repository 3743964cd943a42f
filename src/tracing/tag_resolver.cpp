#include "tracing/tag_resolver.hpp"
#include "tracing/tags.hpp"
#include "core/utils.hpp"

#include <iterator>
#include <unordered_map>

namespace xrayot {

namespace {

const std::unordered_map<std::string_view, std::string_view>& synonym_table() {
    static const std::unordered_map<std::string_view, std::string_view> table = {
        {tags::DB_INSTANCE.key,         "sql.url"},
        {tags::DB_STATEMENT.key,        "sql.sanitized_query"},
        {tags::DB_TYPE.key,             "sql.database_type"},
        {tags::DB_USER.key,             "sql.user"},
        {tags::DB_DRIVER.key,           "sql.driver_version"},
        {tags::DB_VERSION.key,          "sql.database_version"},

        {tags::HTTP_METHOD.key,         "http.request.method"},
        {tags::HTTP_STATUS.key,         "http.response.status"},
        {tags::HTTP_URL.key,            "http.request.url"},
        {tags::HTTP_CLIENT_IP.key,      "http.request.client_ip"},
        {tags::HTTP_USER_AGENT.key,     "http.request.user_agent"},
        {tags::HTTP_CONTENT_LENGTH.key, "http.response.content_length"},

        {tags::VERSION.key,             "service.version"},
    };
    return table;
}

const std::unordered_map<std::string_view, TagTarget>& container_table() {
    static const std::unordered_map<std::string_view, TagTarget> table = {
        {"annotations", TagTarget::ANNOTATIONS},
        {"aws",         TagTarget::AWS},
        {"http",        TagTarget::HTTP},
        {"sql",         TagTarget::SQL},
        {"service",     TagTarget::SERVICE},
    };
    return table;
}

} // anonymous namespace

std::string_view TagResolver::synonym(std::string_view key) {
    const auto& table = synonym_table();
    const auto it = table.find(key);
    return it == table.end() ? key : it->second;
}

TagDestination TagResolver::resolve(std::string_view key) {
    std::vector<std::string> parts = utils::split(std::string(synonym(key)), '.');

    // Empty key (or one made of separators only) still names a field: ""
    if (parts.empty()) {
        parts.emplace_back();
    }

    TagDestination dest;

    const auto& containers = container_table();
    if (const auto it = containers.find(parts.front()); it != containers.end()) {
        dest.target = it->second;
        dest.keys.assign(parts.begin() + 1, parts.end());
        return dest;
    }

    dest.target = TagTarget::METADATA;

    // Chomp an explicit "metadata" prefix, but only if something follows it
    auto first = parts.begin();
    if (parts.size() > 1 && parts.front() == "metadata") {
        ++first;
    }

    // With two or more parts left the first is the namespace
    if (std::distance(first, parts.end()) > 1) {
        dest.metadata_namespace = *first;
        dest.keys.assign(first + 1, parts.end());
    } else {
        dest.metadata_namespace = std::string(metadata_namespaces::DEFAULT);
        dest.keys.push_back(*first);
    }
    return dest;
}

} // namespace xrayot
