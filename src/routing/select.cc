#include "ruta/routing/select.h"

#include <algorithm>

namespace ruta::routing {

std::optional<candidate> select_best(std::vector<candidate> const& candidates) {
  auto const it =
      std::min_element(begin(candidates), end(candidates), is_better);
  return it == end(candidates) ? std::nullopt : std::optional{*it};
}

}  // namespace ruta::routing
