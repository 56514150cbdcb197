#include "ruta/network.h"

#include <algorithm>
#include <limits>
#include <ostream>

#include "utl/enumerate.h"
#include "utl/verify.h"

namespace ruta {

station_idx_t network::register_station(std::string_view name) {
  utl::verify(!name.empty(), "network: empty station name");

  auto const next_idx =
      static_cast<station_idx_t::value_t>(stations_.names_.size());
  auto const s_idx = station_idx_t{next_idx};
  auto const [it, is_new] =
      stations_.name_to_idx_.emplace(std::string{name}, s_idx);
  if (is_new) {
    stations_.names_.emplace_back(name);
  }
  return it->second;
}

line_idx_t network::register_line(
    std::string_view id, std::vector<std::string> const& station_names) {
  utl::verify(!id.empty(), "network: empty line id");
  utl::verify(!station_names.empty(), "network: line {} has no stations", id);
  utl::verify(station_names.size() <= std::numeric_limits<stop_idx_t>::max(),
              "network: line {} has too many stations ({})", id,
              station_names.size());
  utl::verify(!find_line(id).has_value(), "network: duplicate line id {}", id);

  for (auto it = begin(station_names); it != end(station_names); ++it) {
    utl::verify(!it->empty(), "network: empty station name on line {}", id);
    utl::verify(std::find(begin(station_names), it, *it) == it,
                "network: station {} listed twice on line {}", *it, id);
  }

  auto seq = std::vector<station_idx_t>{};
  seq.reserve(station_names.size());
  for (auto const& name : station_names) {
    seq.emplace_back(register_station(name));
  }

  auto const l_idx =
      line_idx_t{static_cast<line_idx_t::value_t>(lines_.ids_.size())};
  lines_.id_to_idx_.emplace(std::string{id}, l_idx);
  lines_.ids_.emplace_back(id);
  lines_.stations_.emplace_back(seq);
  return l_idx;
}

transfer_idx_t network::register_transfer(
    std::string_view station_name, std::vector<std::string> const& line_ids) {
  auto const s = find_station(station_name);
  utl::verify(s.has_value(), "network: transfer station {} not on any line",
              station_name);
  utl::verify(
      std::none_of(begin(transfers_.stations_), end(transfers_.stations_),
                   [&](station_idx_t const x) { return x == *s; }),
      "network: duplicate transfer point {}", station_name);

  auto lines = std::vector<line_idx_t>{};
  for (auto const& id : line_ids) {
    auto const l = find_line(id);
    utl::verify(l.has_value(),
                "network: transfer point {} references unknown line {}",
                station_name, id);
    utl::verify(position(*l, *s).has_value(),
                "network: transfer station {} is not served by line {}",
                station_name, id);
    utl::verify(std::find(begin(lines), end(lines), *l) == end(lines),
                "network: line {} listed twice for transfer point {}", id,
                station_name);
    lines.emplace_back(*l);
  }
  utl::verify(lines.size() >= 2U,
              "network: transfer point {} connects less than two lines",
              station_name);

  auto const t_idx = transfer_idx_t{
      static_cast<transfer_idx_t::value_t>(transfers_.stations_.size())};
  transfers_.stations_.emplace_back(*s);
  transfers_.lines_.emplace_back(lines);
  return t_idx;
}

std::optional<station_idx_t> network::find_station(
    std::string_view name) const {
  auto const it = stations_.name_to_idx_.find(std::string{name});
  return it == end(stations_.name_to_idx_) ? std::nullopt
                                           : std::optional{it->second};
}

std::optional<line_idx_t> network::find_line(std::string_view id) const {
  auto const it = lines_.id_to_idx_.find(std::string{id});
  return it == end(lines_.id_to_idx_) ? std::nullopt
                                      : std::optional{it->second};
}

std::optional<stop_idx_t> network::position(line_idx_t const l,
                                            station_idx_t const s) const {
  auto const seq = lines_.stations_[l];
  for (auto i = stop_idx_t{0U}; i != seq.size(); ++i) {
    if (seq[i] == s) {
      return i;
    }
  }
  return std::nullopt;
}

bool network::serves(transfer_idx_t const t, line_idx_t const l) const {
  auto const lines = transfers_.lines_[t];
  return std::find(lines.begin(), lines.end(), l) != lines.end();
}

std::ostream& operator<<(std::ostream& out, network const& n) {
  for (auto i = 0U; i != n.n_lines(); ++i) {
    auto const l = line_idx_t{i};
    out << n.line_id(l) << ":";
    for (auto const [j, s] : utl::enumerate(n.line_stations(l))) {
      out << (j == 0U ? " " : " -> ") << n.station_name(s);
    }
    out << "\n";
  }
  for (auto i = 0U; i != n.n_transfers(); ++i) {
    auto const t = transfer_idx_t{i};
    out << "TRANSFER " << n.station_name(n.transfers_.stations_[t]) << ":";
    for (auto const l : n.transfers_.lines_[t]) {
      out << " " << n.line_id(l);
    }
    out << "\n";
  }
  return out;
}

}  // namespace ruta
