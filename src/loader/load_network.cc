#include "ruta/loader/load_network.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "utl/parser/buf_reader.h"
#include "utl/parser/csv_range.h"
#include "utl/parser/line_range.h"
#include "utl/pipes/for_each.h"
#include "utl/verify.h"

#include "ruta/loader/files.h"
#include "ruta/logging.h"
#include "ruta/scoped_timer.h"

namespace ruta::loader {

namespace {

// Keeps keys in order of first appearance.
template <typename T>
struct ordered_groups {
  T& operator[](std::string const& key) {
    auto const [it, is_new] = idx_.emplace(key, groups_.size());
    if (is_new) {
      groups_.emplace_back(key, T{});
    }
    return groups_[it->second].second;
  }

  hash_map<std::string, std::size_t> idx_;
  std::vector<std::pair<std::string, T>> groups_;
};

}  // namespace

bool applicable(dir const& d) { return d.exists(kLinesFile); }

void read_lines(network& n, std::string_view file_content) {
  auto const timer = scoped_timer{"read lines"};

  struct csv_line {
    utl::csv_col<utl::cstr, UTL_NAME("line_id")> line_id_;
    utl::csv_col<int, UTL_NAME("stop_sequence")> stop_sequence_;
    utl::csv_col<utl::cstr, UTL_NAME("station_name")> station_name_;
  };

  using stop_seq_t = std::vector<std::pair<int, std::string>>;

  auto lines = ordered_groups<stop_seq_t>{};
  auto row = 1U;
  utl::line_range{utl::make_buf_reader(file_content)}  //
      | utl::csv<csv_line>()  //
      | utl::for_each([&](csv_line const& x) {
          ++row;
          auto const line_id = x.line_id_->trim().view();
          auto const station_name = x.station_name_->trim().view();
          utl::verify(!line_id.empty(), "{}: row {} without line_id",
                      kLinesFile, row);
          utl::verify(!station_name.empty(), "{}: row {} without station_name",
                      kLinesFile, row);
          lines[std::string{line_id}].emplace_back(*x.stop_sequence_,
                                                   std::string{station_name});
        });

  for (auto& [line_id, stops] : lines.groups_) {
    std::stable_sort(begin(stops), end(stops), [](auto&& a, auto&& b) {
      return a.first < b.first;
    });
    auto const dup = std::adjacent_find(
        begin(stops), end(stops),
        [](auto&& a, auto&& b) { return a.first == b.first; });
    utl::verify(dup == end(stops), "{}: line {} has stop_sequence {} twice",
                kLinesFile, line_id, dup == end(stops) ? 0 : dup->first);

    auto station_names = std::vector<std::string>{};
    station_names.reserve(stops.size());
    for (auto& [seq, name] : stops) {
      station_names.emplace_back(std::move(name));
    }
    n.register_line(line_id, station_names);
  }

  log(log_lvl::info, "loader.lines", "{} lines, {} stations", n.n_lines(),
      n.n_stations());
}

void read_transfers(loader_config const& c,
                    network& n,
                    std::string_view file_content) {
  auto const timer = scoped_timer{"read transfers"};

  struct csv_transfer {
    utl::csv_col<utl::cstr, UTL_NAME("station_name")> station_name_;
    utl::csv_col<utl::cstr, UTL_NAME("line_id")> line_id_;
  };

  if (file_content.empty()) {
    return;
  }

  auto transfers = ordered_groups<std::vector<std::string>>{};
  auto row = 1U;
  utl::line_range{utl::make_buf_reader(file_content)}  //
      | utl::csv<csv_transfer>()  //
      | utl::for_each([&](csv_transfer const& x) {
          ++row;
          auto const station_name = x.station_name_->trim().view();
          auto const line_id = x.line_id_->trim().view();

          if (c.skip_invalid_transfers_) {
            auto const s = n.find_station(station_name);
            auto const l = n.find_line(line_id);
            if (!s.has_value() || !l.has_value() ||
                !n.position(*l, *s).has_value()) {
              log(log_lvl::error, "loader.transfers",
                  "{}: row {} skipped, line \"{}\" does not serve \"{}\"",
                  kTransfersFile, row, line_id, station_name);
              return;
            }
          }

          transfers[std::string{station_name}].emplace_back(line_id);
        });

  for (auto const& [station_name, line_ids] : transfers.groups_) {
    if (!c.skip_invalid_transfers_) {
      n.register_transfer(station_name, line_ids);
      continue;
    }

    try {
      n.register_transfer(station_name, line_ids);
    } catch (std::exception const& e) {
      log(log_lvl::error, "loader.transfers", "transfer point {} skipped: {}",
          station_name, e.what());
    }
  }

  log(log_lvl::info, "loader.transfers", "{} transfer points",
      n.n_transfers());
}

network load_network(loader_config const& c, dir const& d) {
  auto const timer = scoped_timer{"load network"};

  utl::verify(applicable(d), "{}: {} not found", d.path().string(),
              kLinesFile);

  auto const load = [&](std::string_view file_name) -> file {
    return d.exists(file_name) ? d.get_file(file_name) : file{};
  };

  auto n = network{};
  read_lines(n, load(kLinesFile).data());
  read_transfers(c, n, load(kTransfersFile).data());
  return n;
}

}  // namespace ruta::loader
