#include "ruta/loader/dir.h"

#include <algorithm>

#include "cista/mmap.h"

#include "utl/parser/cstr.h"
#include "utl/verify.h"

#include "ruta/logging.h"

namespace ruta::loader {

file::content::~content() = default;

dir::~dir() = default;
dir::dir(std::filesystem::path p) : path_{std::move(p)} {}
dir::dir(dir const&) = default;
dir::dir(dir&&) noexcept = default;
dir& dir::operator=(dir const&) = default;
dir& dir::operator=(dir&&) noexcept = default;

std::string normalize(std::filesystem::path const& p) {
  std::string s;
  auto first = true;
  for (auto const& el : p) {
    if (el == ".") {
      continue;
    }
    if (!first) {
      s += "/";
    }
    first = false;
    s += el.generic_string();
  }
  return s;
}

// --- File directory implementation ---
fs_dir::fs_dir(std::filesystem::path p) : dir{std::move(p)} {}
fs_dir::~fs_dir() = default;
std::vector<std::filesystem::path> fs_dir::list_files() const {
  std::vector<std::filesystem::path> paths;
  for (auto const& e : std::filesystem::directory_iterator(path_)) {
    if (e.is_regular_file()) {
      paths.emplace_back(relative(e.path(), path_));
    }
  }
  std::sort(begin(paths), end(paths));
  return paths;
}
file fs_dir::get_file(std::filesystem::path const& p) const {
  struct mmap_content final : public file::content {
    mmap_content() = delete;
    mmap_content(mmap_content const&) = delete;
    mmap_content(mmap_content&&) = delete;
    mmap_content& operator=(mmap_content&&) = delete;
    mmap_content& operator=(mmap_content const&) = delete;
    explicit mmap_content(std::filesystem::path const& p)
        : mmap_{p.string().c_str(), cista::mmap::protection::READ} {
      log(log_lvl::info, "loader.fs_dir", "loaded {}: {} bytes", p.string(),
          mmap_.size());
    }
    ~mmap_content() final = default;
    std::string_view get() const final { return mmap_.view(); }
    cista::mmap mmap_;
  };
  struct empty_content final : public file::content {
    std::string_view get() const final { return {}; }
  };

  auto const full_path = path_ / p;
  utl::verify(std::filesystem::is_regular_file(full_path),
              "fs_dir: file {} not found", full_path.string());
  if (std::filesystem::file_size(full_path) == 0U) {
    return file{full_path.string(), std::make_unique<empty_content>()};
  }
  return file{full_path.string(), std::make_unique<mmap_content>(full_path)};
}
bool fs_dir::exists(std::filesystem::path const& p) const {
  return std::filesystem::is_regular_file(path_ / p);
}
dir_type fs_dir::type() const { return dir_type::kFilesystem; }

// --- In-memory directory implementation ---
mem_dir::mem_dir(dir_t d) : dir{"::memory::"}, dir_{std::move(d)} {}
mem_dir::~mem_dir() = default;
mem_dir::mem_dir(mem_dir const&) = default;
mem_dir::mem_dir(mem_dir&&) noexcept = default;
mem_dir& mem_dir::operator=(mem_dir const&) = default;
mem_dir& mem_dir::operator=(mem_dir&&) noexcept = default;
mem_dir& mem_dir::add(std::pair<std::filesystem::path, std::string> f) {
  dir_.insert_or_assign(normalize(f.first), std::move(f.second));
  return *this;
}
std::vector<std::filesystem::path> mem_dir::list_files() const {
  std::vector<std::filesystem::path> paths;
  for (auto const& [p, _] : dir_) {
    paths.emplace_back(p);
  }
  return paths;
}
file mem_dir::get_file(std::filesystem::path const& p) const {
  struct mem_file_content : public file::content {
    explicit mem_file_content(std::string const& b) : buf_{b} {}
    std::string_view get() const final { return buf_; }
    std::string const& buf_;
  };
  auto const it = dir_.find(normalize(p));
  utl::verify(it != end(dir_), "mem_dir: file {} not found", p.string());
  return file{p.string(), std::make_unique<mem_file_content>(it->second)};
}
bool mem_dir::exists(std::filesystem::path const& p) const {
  return dir_.contains(normalize(p));
}
dir_type mem_dir::type() const { return dir_type::kInMemory; }

std::unique_ptr<dir> make_dir(std::filesystem::path const& p) {
  if (std::filesystem::is_directory(p)) {
    return std::make_unique<fs_dir>(p);
  } else {
    throw utl::fail("path {} is not a directory", p.string());
  }
}

mem_dir mem_dir::read(std::string_view s) {
  std::string_view file_name;
  char const* file_content_begin = nullptr;
  auto dir = mem_dir::dir_t{};
  utl::for_each_line(s, [&](utl::cstr const line) {
    if (line.starts_with("#")) {
      if (file_content_begin != nullptr) {
        auto const content_end =
            std::max(file_content_begin, line.begin() - 1);
        dir.emplace(file_name,
                    std::string{file_content_begin, content_end});
      }
      file_name = line.substr(1).trim();
      file_content_begin = std::min(line.end() + 1, s.data() + s.size());
    }
  });
  if (file_content_begin != nullptr) {
    auto const length =
        static_cast<std::size_t>(s.data() + s.size() - file_content_begin);
    dir.emplace(file_name, std::string{file_content_begin, length});
  }
  return {dir};
}

}  // namespace ruta::loader
