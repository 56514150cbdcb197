#pragma once

namespace ruta::loader {

struct loader_config {
  // Log and drop transfer rows that reference unknown stations or lines
  // instead of failing the whole load.
  bool skip_invalid_transfers_{false};
};

}  // namespace ruta::loader
