#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "ruta/network.h"
#include "ruta/routing/candidate.h"
#include "ruta/routing/query.h"

namespace ruta::routing {

// Leg on line l from position a to position b, if the direction mode allows
// riding it.
std::optional<candidate::leg> make_leg(line_idx_t l,
                                       stop_idx_t a,
                                       stop_idx_t b,
                                       direction_mode);

// Calls fn(candidate&&) for every direct candidate (in line order) and then
// for every one-transfer candidate (ordered by first line, second line,
// transfer point).
template <typename Fn>
void for_each_candidate(network const& n,
                        station_idx_t const from,
                        station_idx_t const to,
                        direction_mode const mode,
                        Fn&& fn) {
  for (auto i = 0U; i != n.n_lines(); ++i) {
    auto const l = line_idx_t{i};
    auto const a = n.position(l, from);
    auto const b = n.position(l, to);
    if (!a.has_value() || !b.has_value()) {
      continue;
    }

    auto const leg = make_leg(l, *a, *b, mode);
    if (leg.has_value()) {
      fn(candidate::from_legs(n, {*leg}));
    }
  }

  for (auto i = 0U; i != n.n_lines(); ++i) {
    auto const l1 = line_idx_t{i};
    auto const a = n.position(l1, from);
    if (!a.has_value()) {
      continue;
    }

    for (auto j = 0U; j != n.n_lines(); ++j) {
      auto const l2 = line_idx_t{j};
      if (l1 == l2) {
        continue;
      }

      auto const b = n.position(l2, to);
      if (!b.has_value()) {
        continue;
      }

      for (auto k = 0U; k != n.n_transfers(); ++k) {
        auto const t = transfer_idx_t{k};
        if (!n.serves(t, l1) || !n.serves(t, l2)) {
          continue;
        }

        auto const s = n.transfers_.stations_[t];
        auto const x1 = n.position(l1, s);
        auto const x2 = n.position(l2, s);
        if (!x1.has_value() || !x2.has_value()) {
          continue;
        }

        auto const first = make_leg(l1, *a, *x1, mode);
        auto const second = make_leg(l2, *x2, *b, mode);
        if (first.has_value() && second.has_value()) {
          fn(candidate::from_legs(n, {*first, *second}));
        }
      }
    }
  }
}

std::vector<candidate> generate_candidates(
    network const&,
    station_idx_t from,
    station_idx_t to,
    direction_mode = direction_mode::kForward);

// Unknown station names yield no candidates.
std::vector<candidate> generate_candidates(
    network const&,
    std::string_view from,
    std::string_view to,
    direction_mode = direction_mode::kForward);

}  // namespace ruta::routing
