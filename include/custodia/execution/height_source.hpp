#pragma once

#include <custodia/schema/primitives.hpp>
#include <functional>

namespace custodia::execution {

/// Current block height, read once per operation.
using height_source_t = std::function<custodia::schema::block_height_t()>;

}  // namespace custodia::execution
