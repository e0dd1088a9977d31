#pragma once

#include <custodia/schema/primitives.hpp>
#include <custodia/schema/signature_envelope.hpp>
#include <functional>
#include <optional>

namespace custodia::execution {

/// Called under the engine's mutex; must not call back into the engine.
using signature_verifier_t =
    std::function<std::optional<custodia::schema::account_id_t>(
        const custodia::schema::bytes_view_t& digest,
        const custodia::schema::signature_envelope_t& envelope)>;

}  // namespace custodia::execution
