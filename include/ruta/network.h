#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ruta/types.h"

namespace ruta {

// Lines with their ordered station sequences and the transfer points that
// connect them. Filled once by the loader, read-only afterwards.
struct network {
  struct stations {
    hash_map<std::string, station_idx_t> name_to_idx_;
    vecvec<station_idx_t, char> names_;
  } stations_;

  struct lines {
    hash_map<std::string, line_idx_t> id_to_idx_;
    vecvec<line_idx_t, char> ids_;
    vecvec<line_idx_t, station_idx_t> stations_;
  } lines_;

  struct transfers {
    vector_map<transfer_idx_t, station_idx_t> stations_;
    vecvec<transfer_idx_t, line_idx_t> lines_;
  } transfers_;

  station_idx_t register_station(std::string_view name);

  line_idx_t register_line(std::string_view id,
                           std::vector<std::string> const& station_names);

  transfer_idx_t register_transfer(std::string_view station_name,
                                   std::vector<std::string> const& line_ids);

  std::optional<station_idx_t> find_station(std::string_view name) const;
  std::optional<line_idx_t> find_line(std::string_view id) const;

  // Position of the station in the stored station sequence of the line.
  std::optional<stop_idx_t> position(line_idx_t, station_idx_t) const;

  bool serves(transfer_idx_t, line_idx_t) const;

  std::string_view station_name(station_idx_t const s) const {
    return stations_.names_[s].view();
  }

  std::string_view line_id(line_idx_t const l) const {
    return lines_.ids_[l].view();
  }

  auto line_stations(line_idx_t const l) const { return lines_.stations_[l]; }

  std::size_t n_stations() const { return stations_.names_.size(); }
  std::size_t n_lines() const { return lines_.ids_.size(); }
  std::size_t n_transfers() const { return transfers_.stations_.size(); }

  friend std::ostream& operator<<(std::ostream&, network const&);
};

}  // namespace ruta
