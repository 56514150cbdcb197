#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ruta::loader {

enum class dir_type { kFilesystem, kInMemory };

struct file {
  struct content {
    virtual ~content();
    virtual std::string_view get() const = 0;
  };

  bool has_value() const noexcept { return content_ != nullptr; }
  std::string_view data() const {
    return content_ == nullptr ? "" : content_->get();
  }
  char const* filename() const { return name_.c_str(); }

  std::string name_;
  std::unique_ptr<content> content_;
};

struct dir {
  dir(std::filesystem::path);
  dir(dir const&);
  dir(dir&&) noexcept;
  dir& operator=(dir const&);
  dir& operator=(dir&&) noexcept;
  virtual ~dir();
  virtual std::vector<std::filesystem::path> list_files() const = 0;
  virtual file get_file(std::filesystem::path const&) const = 0;
  virtual bool exists(std::filesystem::path const&) const = 0;
  virtual dir_type type() const = 0;
  std::filesystem::path path() const { return path_; }

protected:
  std::filesystem::path path_;
};

struct fs_dir final : public dir {
  explicit fs_dir(std::filesystem::path);
  ~fs_dir() final;
  std::vector<std::filesystem::path> list_files() const final;
  file get_file(std::filesystem::path const&) const final;
  bool exists(std::filesystem::path const&) const final;
  dir_type type() const final;
};

struct mem_dir final : public dir {
  using dir_t = std::map<std::filesystem::path, std::string>;

  // Splits a text blob into files. A line "# <name>" starts a new file.
  static mem_dir read(std::string_view);

  mem_dir(dir_t);
  ~mem_dir() final;
  mem_dir(mem_dir const&);
  mem_dir(mem_dir&&) noexcept;
  mem_dir& operator=(mem_dir const&);
  mem_dir& operator=(mem_dir&&) noexcept;
  mem_dir& add(std::pair<std::filesystem::path, std::string>);
  std::vector<std::filesystem::path> list_files() const final;
  file get_file(std::filesystem::path const&) const final;
  bool exists(std::filesystem::path const&) const final;
  dir_type type() const final;
  dir_t dir_;
};

std::unique_ptr<dir> make_dir(std::filesystem::path const& p);

}  // namespace ruta::loader
