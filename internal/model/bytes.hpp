#pragma once

#include <cstdint>
#include <vector>

namespace ducksql::model {

using Bytes = std::vector<std::uint8_t>;

} // namespace ducksql::model
