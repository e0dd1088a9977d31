#include <spdlog/spdlog.h>
#include <custodia/execution/audit_sink.hpp>
#include <memory>
#include <string>

namespace custodia::execution {

namespace {

// Built once; a logger already registered under the name is reused.
std::shared_ptr<spdlog::logger> audit_logger() {
  static const auto logger = [] {
    if (auto existing = spdlog::get("audit")) {
      return existing;
    }
    auto created = spdlog::default_logger()->clone("audit");
    spdlog::register_logger(created);
    return created;
  }();
  return logger;
}

}  // namespace

audit_sink_t log_audit_sink() {
  auto logger = audit_logger();
  return [logger](const custodia::schema::audit_event_t& event) {
    auto attributes = std::string{};
    for (const auto& attribute : event.attributes) {
      attributes += ' ';
      attributes += attribute.key;
      attributes += '=';
      attributes += attribute.value;
    }
    logger->info("#{} h={} {} allocation={} caller={}{}", event.sequence,
                 event.height, custodia::schema::to_string(event.type),
                 event.allocation_id, custodia::schema::to_hex(event.caller),
                 attributes);
  };
}

}  // namespace custodia::execution
