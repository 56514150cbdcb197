#include "ruta/loader/example_network.h"

#include "ruta/loader/load_network.h"

namespace ruta::loader {

mem_dir example_files() {
  return mem_dir::read(R"(
# lines.txt
line_id,stop_sequence,station_name
H72,1,Portal 80
H72,2,Calle 76
H72,3,Calle 72
H72,4,Marly
G12,1,Marly
G12,2,Calle 45
G12,3,Calle 57
G12,4,Portal Sur
K23,1,Portal Norte
K23,2,Calle 100
K23,3,Calle 76
K23,4,Museo Nacional

# transfers.txt
station_name,line_id
Marly,H72
Marly,G12
Calle 76,H72
Calle 76,K23
)");
}

network example_network() {
  return load_network(loader_config{}, example_files());
}

}  // namespace ruta::loader
