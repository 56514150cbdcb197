#pragma once

#include "ruta/loader/dir.h"
#include "ruta/network.h"

namespace ruta::loader {

// Lines H72, G12 and K23 with transfer points at Marly and Calle 76.
mem_dir example_files();

network example_network();

}  // namespace ruta::loader
