#pragma once

#include "manifest.h"
#include "project.h"
#include "util.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

struct archive;

namespace blext {

// Deflated zip with fixed timestamps and permissions, so equal inputs give equal bytes.
// Throws std::runtime_error.
class zip_writer : unmovable {
 public:
  explicit zip_writer(std::filesystem::path const &path);
  ~zip_writer();

  void add_file(std::string const &archive_name, std::filesystem::path const &source);
  void add_text(std::string const &archive_name, std::string_view content);

  void close();

 private:
  void write_header(std::string const &archive_name, std::uint64_t size);

  archive *handle_{ nullptr };
  std::filesystem::path path_;
};

struct pack_request {
  std::string group_name;  // "bl4_2"
  bl_manifest manifest;
  release_profile profile{ release_profile::RELEASE };
  std::map<std::string, std::filesystem::path> wheels;  // filename under wheels/ -> source
  std::filesystem::path out_dir;
};

// "<id>-<version>-<group>.zip"
std::string pack_filename(project const &p, std::string_view group_name);

// Writes the extension zip: blender_manifest.toml, init_settings.toml, wheels/ and the
// project's package (or the script as __init__.py). The zip appears atomically. Returns
// its path.
std::filesystem::path pack_extension(project const &p, pack_request const &req);

}  // namespace blext
