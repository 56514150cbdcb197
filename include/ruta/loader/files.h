#pragma once

#include <string_view>

namespace ruta::loader {

constexpr auto const kLinesFile = std::string_view{"lines.txt"};
constexpr auto const kTransfersFile = std::string_view{"transfers.txt"};

}  // namespace ruta::loader
