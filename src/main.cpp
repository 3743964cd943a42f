#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "entity/entity.hpp"
#include "tracing/tags.hpp"
#include "tracing/tracer.hpp"

#include <format>
#include <stdexcept>
#include <string>

using namespace xrayot;

namespace {

void record_demo_trace(Tracer& tracer, const TracerConfig& config) {
    auto root_builder = tracer.build_span(config.service.name);
    root_builder.with_tag(tags::HTTP_METHOD, "GET")
                .with_tag(tags::HTTP_URL, "http://localhost/orders/42")
                .with_tag(tags::USER, "demo-user");
    if (!config.service.version.empty()) {
        root_builder.with_tag(tags::VERSION, config.service.version);
    }
    auto root = root_builder.start_active(true);

    {
        ScopedSpan query(tracer, "orders-db");
        query->set_tag(tags::DB_TYPE, "postgresql")
              .set_tag(tags::DB_STATEMENT, "SELECT * FROM orders WHERE id = ?")
              .set_tag("annotations.order_id", 42);
        query->log("query executed");
    }

    auto child = tracer.build_span("render").start();
    try {
        throw std::runtime_error("template cache miss");
    } catch (const std::exception&) {
        child->log(LogFields{{std::string(log_fields::EVENT), std::string("error")},
                             {std::string(log_fields::ERROR_OBJECT), std::current_exception()}});
    }
    child->finish();

    root->span()->set_tag(tags::HTTP_STATUS, 200);
    utils::log::info(std::format("Trace {} recorded",
                                 root->span()->entity()->trace_id()));
    root->close();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("xrayot demo starting...");

        auto config_result = argc > 1
            ? ConfigLoader::load_from_file(argv[1])
            : ConfigLoader::load_defaults();
        if (!config_result.is_ok()) {
            utils::log::error(config_result.error_message());
            return 1;
        }
        const auto& config = config_result.value();
        if (argc > 1) {
            utils::log::info(std::format("Config loaded from {}", argv[1]));
        }

        auto tracer = Tracer::from_config(config);
        record_demo_trace(*tracer, config);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
