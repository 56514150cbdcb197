#include <filesystem>
#include <iostream>
#include <string>

#include "boost/program_options.hpp"

#include "ruta/cli.h"
#include "ruta/loader/example_network.h"
#include "ruta/loader/load_network.h"
#include "ruta/logging.h"

namespace fs = std::filesystem;
namespace bpo = boost::program_options;
using namespace ruta;

int main(int ac, char** av) {
  auto in = fs::path{};
  auto from = std::string{};
  auto to = std::string{};
  auto list = false;
  auto all = false;
  auto both_directions = false;
  auto verbose = false;
  auto c = loader::loader_config{};

  auto desc = bpo::options_description{"Options"};
  desc.add_options()  //
      ("help,h", "produce this help message")  //
      ("in,i", bpo::value(&in),
       "network directory with lines.txt and transfers.txt "
       "(default: built-in example network)")  //
      ("from,f", bpo::value(&from), "origin station name or menu number")  //
      ("to,t", bpo::value(&to), "destination station name or menu number")  //
      ("list,l", bpo::bool_switch(&list)->default_value(false),
       "print the numbered station menu")  //
      ("all,a", bpo::bool_switch(&all)->default_value(false),
       "print all candidates, not only the best route")  //
      ("both_directions", bpo::bool_switch(&both_directions)
                              ->default_value(false),
       "allow riding lines against their stored station order")  //
      ("skip_invalid_transfers",
       bpo::bool_switch(&c.skip_invalid_transfers_)->default_value(false),
       "drop malformed transfer rows instead of failing")  //
      ("verbose,v", bpo::bool_switch(&verbose)->default_value(false),
       "debug logging");

  auto vm = bpo::variables_map{};
  try {
    bpo::store(bpo::command_line_parser(ac, av).options(desc).run(), vm);
    bpo::notify(vm);
  } catch (std::exception const& e) {
    std::cerr << e.what() << "\n" << desc << "\n";
    return static_cast<int>(exit_code::kInvalid);
  }

  if (vm.count("help") != 0U) {
    std::cout << desc << "\n";
    return 0;
  }

  s_verbosity = verbose ? log_lvl::debug : log_lvl::error;

  auto n = network{};
  try {
    n = in.empty() ? loader::example_network()
                   : loader::load_network(c, *loader::make_dir(in));
  } catch (std::exception const& e) {
    std::cerr << "could not load network: " << e.what() << "\n";
    return static_cast<int>(exit_code::kInvalid);
  }

  if (list) {
    print_menu(std::cout, n);
    if (from.empty() && to.empty()) {
      return 0;
    }
  }

  auto const from_name = resolve_station(n, from);
  auto const to_name = resolve_station(n, to);
  if (!from_name.has_value() || !to_name.has_value()) {
    return static_cast<int>(exit_code::kInvalid);
  }

  auto const q = routing::query{
      .from_ = *from_name,
      .to_ = *to_name,
      .direction_mode_ = both_directions ? routing::direction_mode::kBoth
                                         : routing::direction_mode::kForward};

  return static_cast<int>(print_plan(std::cout, std::cerr, n, q, all));
}
