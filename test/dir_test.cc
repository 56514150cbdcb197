#include "gtest/gtest.h"

#include "ruta/loader/dir.h"

#include "utl/parser/cstr.h"
#include "utl/to_vec.h"
#include "utl/zip.h"

using namespace ruta::loader;

constexpr auto const data = std::string_view{R"(station_name,line_id
Marly,H72
Marly,G12
)"};

TEST(dir, file_contents) {
  auto const fs = fs_dir{"test/test_data/network"};
  auto const mem = mem_dir{{{"transfers.txt", std::string{data}}}};
  auto const fs_transfers = fs.get_file("transfers.txt");
  auto const mem_transfers = mem.get_file("transfers.txt");

  for (auto const [ref, a, b] :
       utl::czip_no_size_check(utl::lines(data), utl::lines(fs_transfers.data()),
                               utl::lines(mem_transfers.data()))) {
    EXPECT_EQ(ref.view(), a.view());
    EXPECT_EQ(ref.view(), b.view());
  }
}

TEST(dir, directory_listing) {
  auto const fs = fs_dir{"test/test_data/network"};
  auto const mem = mem_dir{
      mem_dir::dir_t{{"transfers.txt", ""}, {"lines.txt", ""}}};

  auto const to_str = [](std::vector<std::filesystem::path> const& paths) {
    return utl::to_vec(paths, [](auto&& p) { return p.generic_string(); });
  };
  auto const expected = std::vector<std::string>{"lines.txt", "transfers.txt"};
  EXPECT_EQ(expected, to_str(fs.list_files()));
  EXPECT_EQ(expected, to_str(mem.list_files()));
}

TEST(dir, exists) {
  auto const fs = fs_dir{"test/test_data/network"};
  EXPECT_TRUE(fs.exists("lines.txt"));
  EXPECT_FALSE(fs.exists("stops.txt"));
  EXPECT_EQ(dir_type::kFilesystem, fs.type());

  auto mem = mem_dir{mem_dir::dir_t{}};
  mem.add({"./lines.txt", ""});
  EXPECT_TRUE(mem.exists("lines.txt"));
  EXPECT_FALSE(mem.exists("transfers.txt"));
  EXPECT_EQ(dir_type::kInMemory, mem.type());
}

TEST(dir, missing_file) {
  auto const fs = fs_dir{"test/test_data/network"};
  auto const mem = mem_dir{mem_dir::dir_t{}};
  EXPECT_THROW(fs.get_file("stops.txt"), std::runtime_error);
  EXPECT_THROW(mem.get_file("stops.txt"), std::runtime_error);
  EXPECT_THROW(make_dir("test/test_data/network/lines.txt"),
               std::runtime_error);
}

TEST(dir, mem_dir_read) {
  auto const d = mem_dir::read(R"(
# lines.txt
line_id,stop_sequence,station_name
H72,1,Portal 80

# transfers.txt
station_name,line_id
)");

  ASSERT_EQ(2U, d.dir_.size());
  EXPECT_EQ("line_id,stop_sequence,station_name\nH72,1,Portal 80\n",
            d.get_file("lines.txt").data());
  EXPECT_EQ("station_name,line_id\n", d.get_file("transfers.txt").data());
}

TEST(dir, mem_dir_read_empty_files) {
  auto const trailing = mem_dir::read("# lines.txt\nline_id\n# transfers.txt");
  ASSERT_EQ(2U, trailing.dir_.size());
  EXPECT_EQ("line_id", trailing.get_file("lines.txt").data());
  EXPECT_EQ("", trailing.get_file("transfers.txt").data());

  auto const consecutive = mem_dir::read("# lines.txt\n# transfers.txt\n");
  ASSERT_EQ(2U, consecutive.dir_.size());
  EXPECT_EQ("", consecutive.get_file("lines.txt").data());
  EXPECT_EQ("", consecutive.get_file("transfers.txt").data());
}
