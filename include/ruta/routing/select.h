#pragma once

#include <optional>
#include <tuple>
#include <vector>

#include "ruta/routing/candidate.h"

namespace ruta::routing {

// Fewer transfers first, then fewer stations.
inline bool is_better(candidate const& a, candidate const& b) {
  return std::tuple{a.transfers(), a.n_stations()} <
         std::tuple{b.transfers(), b.n_stations()};
}

// Exact ties resolve to the earliest candidate.
std::optional<candidate> select_best(std::vector<candidate> const&);

}  // namespace ruta::routing
