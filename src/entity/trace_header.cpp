#include "entity/trace_header.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <format>

namespace xrayot {

namespace {

bool is_valid_hex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

std::optional<TraceHeader> TraceHeader::parse(std::string_view header) {
    TraceHeader result;

    // Fields are ';'-separated "Key=Value" pairs in any order
    while (!header.empty()) {
        const size_t sep = header.find(';');
        const std::string_view field = trim_view(header.substr(0, sep));
        header = (sep == std::string_view::npos) ? std::string_view{} : header.substr(sep + 1);

        const size_t eq = field.find('=');
        if (eq == std::string_view::npos) continue;

        const std::string_view key = trim_view(field.substr(0, eq));
        const std::string_view value = trim_view(field.substr(eq + 1));

        if (key == "Root") {
            if (!is_valid_trace_id(value)) return std::nullopt;
            result.root_trace_id = std::string(value);
        } else if (key == "Parent") {
            if (value.size() != 16 || !is_valid_hex(value)) return std::nullopt;
            result.parent_id = std::string(value);
        } else if (key == "Sampled") {
            if (value == "1") result.sampled = SampleDecision::SAMPLED;
            else if (value == "0") result.sampled = SampleDecision::NOT_SAMPLED;
            else if (value == "?") result.sampled = SampleDecision::REQUESTED;
            else result.sampled = SampleDecision::UNKNOWN;
        }
    }

    if (!result.has_root()) return std::nullopt;
    return result;
}

std::string TraceHeader::to_string() const {
    std::string out;
    if (!root_trace_id.empty()) {
        out += std::format("Root={}", root_trace_id);
    }
    if (!parent_id.empty()) {
        if (!out.empty()) out += ';';
        out += std::format("Parent={}", parent_id);
    }

    const char* decision = nullptr;
    switch (sampled) {
        case SampleDecision::SAMPLED:     decision = "1"; break;
        case SampleDecision::NOT_SAMPLED: decision = "0"; break;
        case SampleDecision::REQUESTED:   decision = "?"; break;
        case SampleDecision::UNKNOWN:     break;
    }
    if (decision) {
        if (!out.empty()) out += ';';
        out += std::format("Sampled={}", decision);
    }
    return out;
}

std::string TraceHeader::generate_trace_id() {
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::format("1-{:08x}-{}", static_cast<uint32_t>(epoch), utils::random_hex(12));
}

std::string TraceHeader::generate_entity_id() {
    return utils::random_hex(8); // 8 bytes = 16 hex chars
}

bool TraceHeader::is_valid_trace_id(std::string_view trace_id) {
    // "1-" + 8 hex + "-" + 24 hex = 35 chars
    if (trace_id.size() != 35) return false;
    if (trace_id[0] != '1' || trace_id[1] != '-' || trace_id[10] != '-') return false;
    return is_valid_hex(trace_id.substr(2, 8)) && is_valid_hex(trace_id.substr(11, 24));
}

} // namespace xrayot
