#include "ruta/routing/plan.h"

#include "ruta/logging.h"
#include "ruta/routing/generate.h"
#include "ruta/routing/select.h"

namespace ruta::routing {

plan_result plan(network const& n, query const& q) {
  auto const reject = [&](query_error const e) {
    log(log_lvl::error, "routing.plan", "invalid query {} -> {}: {}",
        q.from_, q.to_, to_str(e));
    return plan_result{.error_ = e};
  };

  if (q.from_.empty() || q.to_.empty()) {
    return reject(query_error::kEmptyStation);
  }

  auto const from = n.find_station(q.from_);
  auto const to = n.find_station(q.to_);
  if (!from.has_value() || !to.has_value()) {
    return reject(query_error::kUnknownStation);
  }

  if (*from == *to) {
    return reject(query_error::kSameStation);
  }

  auto const candidates =
      generate_candidates(n, *from, *to, q.direction_mode_);
  auto r = plan_result{.route_ = select_best(candidates),
                       .n_candidates_ = candidates.size()};

  if (r.has_route()) {
    log(log_lvl::debug, "routing.plan",
        "{} -> {} [{}]: {} candidates, best {} with {} stations", q.from_,
        q.to_, to_str(q.direction_mode_), r.n_candidates_,
        r.route_->label(n), r.route_->n_stations());
  } else {
    log(log_lvl::debug, "routing.plan", "{} -> {} [{}]: no route", q.from_,
        q.to_, to_str(q.direction_mode_));
  }

  return r;
}

}  // namespace ruta::routing
