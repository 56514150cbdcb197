#pragma once

#include <cinttypes>
#include <optional>
#include <string_view>

#include "ruta/network.h"
#include "ruta/routing/candidate.h"
#include "ruta/routing/query.h"

namespace ruta::routing {

enum class query_error : std::uint8_t {
  kEmptyStation,
  kUnknownStation,
  kSameStation
};

inline std::string_view to_str(query_error const e) {
  switch (e) {
    case query_error::kEmptyStation: return "empty station name";
    case query_error::kUnknownStation: return "unknown station";
    case query_error::kSameStation: return "origin equals destination";
  }
  return "";
}

struct plan_result {
  bool has_route() const { return route_.has_value(); }
  bool is_valid() const { return !error_.has_value(); }

  std::optional<query_error> error_;
  std::optional<candidate> route_;
  std::size_t n_candidates_{0U};
};

// Evaluates the query from scratch on every call. An unknown station is
// reported as query_error::kUnknownStation and yields no route.
plan_result plan(network const&, query const&);

}  // namespace ruta::routing
