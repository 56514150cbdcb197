#pragma once

#include <cinttypes>
#include <string>
#include <string_view>

namespace ruta::routing {

enum class direction_mode : std::uint8_t {
  kForward,  // only along the stored station order of each line
  kBoth
};

inline std::string_view to_str(direction_mode const m) {
  return m == direction_mode::kForward ? "forward" : "both";
}

struct query {
  std::string from_;
  std::string to_;
  direction_mode direction_mode_{direction_mode::kForward};
};

}  // namespace ruta::routing
