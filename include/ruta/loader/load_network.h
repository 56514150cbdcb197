#pragma once

#include <string_view>

#include "ruta/loader/dir.h"
#include "ruta/loader/loader_config.h"
#include "ruta/network.h"

namespace ruta::loader {

bool applicable(dir const&);

void read_lines(network&, std::string_view file_content);

void read_transfers(loader_config const&,
                    network&,
                    std::string_view file_content);

network load_network(loader_config const&, dir const&);

}  // namespace ruta::loader
