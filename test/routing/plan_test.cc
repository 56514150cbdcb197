#include <algorithm>
#include <sstream>

#include "gtest/gtest.h"

#include "ruta/loader/example_network.h"
#include "ruta/loader/load_network.h"
#include "ruta/routing/generate.h"
#include "ruta/routing/plan.h"

using namespace ruta;
using namespace ruta::routing;

namespace {

using sv = std::vector<std::string_view>;

network h72_g12() {
  return loader::load_network(loader::loader_config{}, loader::mem_dir::read(R"(
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

# transfers.txt
station_name,line_id
Marly,H72
Marly,G12
)"));
}

}  // namespace

TEST(plan, direct_route) {
  auto const n = h72_g12();
  auto const r = plan(n, {.from_ = "Portal 80", .to_ = "Calle 72"});

  ASSERT_TRUE(r.is_valid());
  ASSERT_TRUE(r.has_route());
  EXPECT_EQ(candidate_kind::kDirect, r.route_->kind());
  EXPECT_EQ("H72", r.route_->label(n));
  EXPECT_EQ((sv{"Portal 80", "Calle 76", "Calle 72"}),
            r.route_->station_names(n));
  EXPECT_EQ(0U, r.route_->transfers());
  EXPECT_EQ(3U, r.route_->n_stations());
  EXPECT_EQ(1U, r.n_candidates_);
}

TEST(plan, transfer_route) {
  auto const n = h72_g12();
  auto const r = plan(n, {.from_ = "Portal 80", .to_ = "Portal Sur"});

  ASSERT_TRUE(r.is_valid());
  ASSERT_TRUE(r.has_route());
  EXPECT_EQ(candidate_kind::kTransfer, r.route_->kind());
  EXPECT_EQ("H72 -> G12", r.route_->label(n));
  EXPECT_EQ((sv{"Portal 80", "Calle 76", "Calle 72", "Marly", "Calle 45",
                "Calle 57", "Portal Sur"}),
            r.route_->station_names(n));
  EXPECT_EQ(1U, r.route_->transfers());
  EXPECT_EQ(7U, r.route_->n_stations());
}

TEST(plan, reverse_direction_has_no_route) {
  auto const n = h72_g12();
  auto const r = plan(n, {.from_ = "Portal Sur", .to_ = "Portal 80"});

  EXPECT_TRUE(r.is_valid());
  EXPECT_FALSE(r.has_route());
  EXPECT_EQ(0U, r.n_candidates_);
}

TEST(plan, reverse_direction_with_both_directions) {
  auto const n = h72_g12();
  auto const r = plan(n, {.from_ = "Portal Sur",
                          .to_ = "Portal 80",
                          .direction_mode_ = direction_mode::kBoth});

  ASSERT_TRUE(r.is_valid());
  ASSERT_TRUE(r.has_route());
  EXPECT_EQ("G12 -> H72", r.route_->label(n));
  EXPECT_EQ(7U, r.route_->n_stations());
}

TEST(plan, same_station) {
  auto const n = h72_g12();
  auto const r = plan(n, {.from_ = "Marly", .to_ = "Marly"});

  EXPECT_FALSE(r.is_valid());
  EXPECT_EQ(query_error::kSameStation, r.error_);
  EXPECT_FALSE(r.has_route());
}

TEST(plan, same_station_for_every_station) {
  auto const n = loader::example_network();
  for (auto i = 0U; i != n.n_stations(); ++i) {
    auto const s = std::string{n.station_name(station_idx_t{i})};
    EXPECT_EQ(query_error::kSameStation,
              plan(n, {.from_ = s, .to_ = s}).error_);
  }
}

TEST(plan, unknown_station) {
  auto const n = h72_g12();

  auto const a = plan(n, {.from_ = "Usme", .to_ = "Marly"});
  EXPECT_EQ(query_error::kUnknownStation, a.error_);
  EXPECT_FALSE(a.has_route());

  auto const b = plan(n, {.from_ = "Marly", .to_ = "Usme"});
  EXPECT_EQ(query_error::kUnknownStation, b.error_);
  EXPECT_FALSE(b.has_route());
}

TEST(plan, empty_station) {
  auto const n = h72_g12();
  EXPECT_EQ(query_error::kEmptyStation,
            plan(n, {.from_ = "", .to_ = "Marly"}).error_);
  EXPECT_EQ(query_error::kEmptyStation,
            plan(n, {.from_ = "Marly", .to_ = ""}).error_);
}

TEST(plan, idempotent) {
  auto const n = loader::example_network();
  auto const q = query{.from_ = "Portal Norte", .to_ = "Marly"};

  auto const a = plan(n, q);
  auto const b = plan(n, q);
  ASSERT_TRUE(a.has_route());
  EXPECT_EQ(a.route_, b.route_);
  EXPECT_EQ(a.error_, b.error_);
  EXPECT_EQ(a.n_candidates_, b.n_candidates_);
}

TEST(plan, no_state_between_calls) {
  auto const n = loader::example_network();

  auto const invalid = plan(n, {.from_ = "Marly", .to_ = "Marly"});
  EXPECT_FALSE(invalid.is_valid());

  auto const found = plan(n, {.from_ = "Portal 80", .to_ = "Calle 72"});
  EXPECT_TRUE(found.is_valid());
  ASSERT_TRUE(found.has_route());
  EXPECT_EQ("H72", found.route_->label(n));

  auto const none = plan(n, {.from_ = "Portal Sur", .to_ = "Portal 80"});
  EXPECT_TRUE(none.is_valid());
  EXPECT_FALSE(none.has_route());
}

TEST(plan, direct_beats_transfer) {
  auto const n = loader::example_network();
  for (auto i = 0U; i != n.n_stations(); ++i) {
    for (auto j = 0U; j != n.n_stations(); ++j) {
      if (i == j) {
        continue;
      }
      auto const q =
          query{.from_ = std::string{n.station_name(station_idx_t{i})},
                .to_ = std::string{n.station_name(station_idx_t{j})},
                .direction_mode_ = direction_mode::kBoth};
      auto const candidates =
          generate_candidates(n, q.from_, q.to_, q.direction_mode_);
      auto const has_direct =
          std::any_of(begin(candidates), end(candidates), [](auto&& c) {
            return c.transfers() == 0U;
          });
      auto const r = plan(n, q);
      ASSERT_EQ(!candidates.empty(), r.has_route());
      if (has_direct) {
        EXPECT_EQ(0U, r.route_->transfers());
      }
    }
  }
}

TEST(plan, print) {
  auto const n = h72_g12();
  auto const r = plan(n, {.from_ = "Portal 80", .to_ = "Portal Sur"});
  ASSERT_TRUE(r.has_route());

  auto ss = std::stringstream{};
  r.route_->print(ss, n);
  EXPECT_EQ(R"(TRANSFER H72 -> G12 [transfers=1, stations=7]
  LINE H72 (FWD): Portal 80 -> Marly
  LINE G12 (FWD): Marly -> Portal Sur
  1: Portal 80
  2: Calle 76
  3: Calle 72
  4: Marly [transfer]
  5: Calle 45
  6: Calle 57
  7: Portal Sur
)",
            ss.str());
}
