#include "ruta/routing/generate.h"

namespace ruta::routing {

std::optional<candidate::leg> make_leg(line_idx_t const l,
                                       stop_idx_t const a,
                                       stop_idx_t const b,
                                       direction_mode const mode) {
  if (a < b) {
    return candidate::leg{l, a, b, direction::kForward};
  } else if (a > b && mode == direction_mode::kBoth) {
    return candidate::leg{l, a, b, direction::kBackward};
  } else {
    return std::nullopt;
  }
}

std::vector<candidate> generate_candidates(network const& n,
                                           station_idx_t const from,
                                           station_idx_t const to,
                                           direction_mode const mode) {
  auto candidates = std::vector<candidate>{};
  for_each_candidate(n, from, to, mode, [&](candidate&& c) {
    candidates.emplace_back(std::move(c));
  });
  return candidates;
}

std::vector<candidate> generate_candidates(network const& n,
                                           std::string_view from,
                                           std::string_view to,
                                           direction_mode const mode) {
  auto const from_station = n.find_station(from);
  auto const to_station = n.find_station(to);
  if (!from_station.has_value() || !to_station.has_value()) {
    return {};
  }
  return generate_candidates(n, *from_station, *to_station, mode);
}

}  // namespace ruta::routing
