#include "ruta/cli.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <ostream>

#include "utl/parser/arg_parser.h"
#include "utl/parser/cstr.h"

#include "ruta/logging.h"
#include "ruta/routing/generate.h"
#include "ruta/routing/plan.h"

namespace ruta {

void print_menu(std::ostream& out, network const& n) {
  out << "STATIONS:\n";
  for (auto i = 0U; i != n.n_stations(); ++i) {
    out << "  " << (i + 1U) << ": " << n.station_name(station_idx_t{i})
        << "\n";
  }
}

std::optional<std::string> resolve_station(network const& n,
                                           std::string_view arg) {
  auto const is_number =
      !arg.empty() && std::all_of(begin(arg), end(arg), [](char const c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      });
  if (!is_number) {
    return std::string{arg};
  }

  auto const out_of_range = [&]() -> std::optional<std::string> {
    log(log_lvl::error, "cli.menu", "menu number {} out of range [1, {}]", arg,
        n.n_stations());
    return std::nullopt;
  };

  // utl::parse does not detect overflow
  if (arg.size() > std::numeric_limits<unsigned>::digits10) {
    return out_of_range();
  }

  auto const i = utl::parse<unsigned>(utl::cstr{arg});
  if (i == 0U || i > n.n_stations()) {
    return out_of_range();
  }
  return std::string{n.station_name(station_idx_t{i - 1U})};
}

exit_code print_plan(std::ostream& out,
                     std::ostream& err,
                     network const& n,
                     routing::query const& q,
                     bool const print_all) {
  auto const r = routing::plan(n, q);
  if (!r.is_valid()) {
    err << "invalid query: " << routing::to_str(*r.error_) << "\n";
    return exit_code::kInvalid;
  }

  if (print_all) {
    for (auto const& c : routing::generate_candidates(n, q.from_, q.to_,
                                                      q.direction_mode_)) {
      c.print(out, n);
    }
    out << "---\n";
  }

  if (!r.has_route()) {
    out << "no route from " << q.from_ << " to " << q.to_ << "\n";
    return exit_code::kNoRoute;
  }

  r.route_->print(out, n);
  return exit_code::kRoute;
}

}  // namespace ruta
