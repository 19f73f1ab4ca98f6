#pragma once

#include <cstdint>
#include <vector>

namespace tekanim::core {

using Bytes = std::vector<uint8_t>;

} // namespace tekanim::core
