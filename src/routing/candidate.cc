#include "ruta/routing/candidate.h"

#include <ostream>

#include "utl/enumerate.h"
#include "utl/verify.h"

#include "ruta/network.h"

namespace ruta::routing {

candidate candidate::from_legs(network const& n, std::vector<leg> legs) {
  utl::verify(!legs.empty(), "candidate without legs");

  auto c = candidate{};
  for (auto const& l : legs) {
    auto const seq = n.line_stations(l.line_);
    auto const skip_first = !c.stations_.empty();
    if (l.dir_ == direction::kForward) {
      for (auto i = l.from_ + (skip_first ? 1U : 0U); i <= l.to_; ++i) {
        c.stations_.emplace_back(seq[i]);
      }
    } else {
      for (auto i = static_cast<int>(l.from_) - (skip_first ? 1 : 0);
           i >= static_cast<int>(l.to_); --i) {
        c.stations_.emplace_back(seq[static_cast<unsigned>(i)]);
      }
    }
  }
  c.legs_ = std::move(legs);
  return c;
}

std::optional<station_idx_t> candidate::transfer_station() const {
  if (kind() == candidate_kind::kDirect) {
    return std::nullopt;
  }
  return stations_[legs_.front().n_stations() - 1U];
}

std::string candidate::label(network const& n) const {
  auto s = std::string{};
  for (auto const [i, l] : utl::enumerate(legs_)) {
    if (i != 0U) {
      s += " -> ";
    }
    s += n.line_id(l.line_);
  }
  return s;
}

std::vector<std::string_view> candidate::station_names(
    network const& n) const {
  auto names = std::vector<std::string_view>{};
  names.reserve(stations_.size());
  for (auto const s : stations_) {
    names.emplace_back(n.station_name(s));
  }
  return names;
}

void candidate::print(std::ostream& out, network const& n) const {
  out << to_str(kind()) << " " << label(n)
      << " [transfers=" << static_cast<int>(transfers())
      << ", stations=" << n_stations() << "]\n";

  for (auto const& l : legs_) {
    auto const seq = n.line_stations(l.line_);
    out << "  LINE " << n.line_id(l.line_) << " (" << to_str(l.dir_)
        << "): " << n.station_name(seq[l.from_]) << " -> "
        << n.station_name(seq[l.to_]) << "\n";
  }

  auto const transfer = transfer_station();
  for (auto const [i, s] : utl::enumerate(stations_)) {
    out << "  " << (i + 1U) << ": " << n.station_name(s);
    if (transfer.has_value() && *transfer == s) {
      out << " [transfer]";
    }
    out << "\n";
  }
}

}  // namespace ruta::routing
