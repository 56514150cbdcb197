#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "ruta/network.h"
#include "ruta/routing/query.h"

namespace ruta {

// Stations in registration order, numbered from 1.
void print_menu(std::ostream&, network const&);

// A string of digits is a menu number and maps to the station name, other
// arguments are returned as they are. Numbers outside [1, n_stations]
// yield std::nullopt.
std::optional<std::string> resolve_station(network const&, std::string_view);

enum class exit_code : int { kRoute = 0, kInvalid = 1, kNoRoute = 2 };

// Plans the query and prints the best route to out, the query error to err.
// With print_all, every candidate of a valid query is listed first.
exit_code print_plan(std::ostream& out,
                     std::ostream& err,
                     network const&,
                     routing::query const&,
                     bool print_all);

}  // namespace ruta
