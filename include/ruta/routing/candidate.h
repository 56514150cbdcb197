#pragma once

#include <cinttypes>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ruta/types.h"

namespace ruta {
struct network;
}  // namespace ruta

namespace ruta::routing {

enum class candidate_kind : std::uint8_t { kDirect, kTransfer };

inline std::string_view to_str(candidate_kind const k) {
  return k == candidate_kind::kDirect ? "DIRECT" : "TRANSFER";
}

struct candidate {
  struct leg {
    friend bool operator==(leg const&, leg const&) = default;

    stop_idx_t n_stations() const {
      return static_cast<stop_idx_t>((from_ < to_ ? to_ - from_ : from_ - to_) +
                                     1U);
    }

    line_idx_t line_;
    stop_idx_t from_, to_;  // positions in the stored sequence of line_
    direction dir_;
  };

  // Concatenates the station slices of all legs. Consecutive legs share
  // their transfer station, it is kept once.
  static candidate from_legs(network const&, std::vector<leg>);

  friend bool operator==(candidate const&, candidate const&) = default;

  candidate_kind kind() const {
    return legs_.size() == 1U ? candidate_kind::kDirect
                              : candidate_kind::kTransfer;
  }

  std::uint8_t transfers() const {
    return static_cast<std::uint8_t>(legs_.size() - 1U);
  }

  std::size_t n_stations() const { return stations_.size(); }

  std::optional<station_idx_t> transfer_station() const;

  std::string label(network const&) const;

  std::vector<std::string_view> station_names(network const&) const;

  void print(std::ostream&, network const&) const;

  std::vector<leg> legs_;
  std::vector<station_idx_t> stations_;
};

}  // namespace ruta::routing
