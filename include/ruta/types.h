#pragma once

#include <cinttypes>
#include <string_view>

#include "cista/containers/hash_map.h"
#include "cista/containers/vector.h"
#include "cista/containers/vecvec.h"
#include "cista/strong.h"

namespace ruta {

template <typename K, typename V>
using vector_map = cista::raw::vector_map<K, V>;

template <typename K, typename V, typename SizeType = cista::base_t<K>>
using vecvec = cista::raw::vecvec<K, V, SizeType>;

template <typename K,
          typename V,
          typename Hash = cista::hash_all,
          typename Equality = cista::equals_all>
using hash_map = cista::raw::hash_map<K, V, Hash, Equality>;

using stop_idx_t = std::uint16_t;

using station_idx_t = cista::strong<std::uint32_t, struct _station_idx>;
using line_idx_t = cista::strong<std::uint32_t, struct _line_idx>;
using transfer_idx_t = cista::strong<std::uint32_t, struct _transfer_idx>;

enum class direction {
  kForward,
  kBackward  // against the stored station order of the line
};

inline std::string_view to_str(direction const d) {
  return d == direction::kForward ? "FWD" : "BWD";
}

}  // namespace ruta
