#pragma once

#include <custodia/schema/audit_event.hpp>
#include <functional>

namespace custodia::execution {

/// Receives each committed event after the engine has released its mutex.
/// With concurrent callers, events may arrive out of `sequence` order.
using audit_sink_t =
    std::function<void(const custodia::schema::audit_event_t&)>;

/// Sink that writes each event as one line on the "audit" spdlog logger.
audit_sink_t log_audit_sink();

}  // namespace custodia::execution
