#include "pack.h"

#include "platform.h"
#include "tui.h"

#include <archive.h>
#include <archive_entry.h>

#include <cstdio>
#include <ctime>
#include <map>
#include <memory>
#include <stdexcept>
#include <vector>

namespace blext {

namespace {

// 1980-01-01, the earliest time a zip entry can carry.
constexpr time_t kFixedMtime{ 315532800 };

std::runtime_error archive_failure(std::string const &what, archive *a) {
  char const *detail{ a ? archive_error_string(a) : nullptr };
  return std::runtime_error(what + (detail ? std::string{ ": " } + detail : std::string{}));
}

bool skipped_dir(std::filesystem::path const &name) {
  return name == "__pycache__" || name == ".git";
}

bool skipped_file(std::filesystem::path const &relative) {
  if (relative.extension() == ".pyc") { return true; }
  return relative == "blender_manifest.toml" || relative == "init_settings.toml";
}

// archive name -> source file, sorted.
std::map<std::string, std::filesystem::path> package_files(project const &p) {
  std::map<std::string, std::filesystem::path> files;
  if (p.files.is_script()) {
    files.emplace("__init__.py", p.files.spec_path);
    return files;
  }

  auto const root{ p.package_dir() };
  for (auto it{ std::filesystem::recursive_directory_iterator{ root } };
       it != std::filesystem::recursive_directory_iterator{};
       ++it) {
    if (it->is_directory()) {
      if (skipped_dir(it->path().filename())) { it.disable_recursion_pending(); }
      continue;
    }
    if (!it->is_regular_file()) { continue; }
    auto const relative{ it->path().lexically_relative(root) };
    if (skipped_file(relative)) { continue; }
    files.emplace(relative.generic_string(), it->path());
  }
  return files;
}

}  // namespace

zip_writer::zip_writer(std::filesystem::path const &path) : path_{ path } {
  handle_ = archive_write_new();
  if (!handle_) { throw std::runtime_error("archive_write_new failed"); }
  if (archive_write_set_format_zip(handle_) != ARCHIVE_OK ||
      archive_write_zip_set_compression_deflate(handle_) != ARCHIVE_OK ||
      archive_write_open_filename(handle_, path.string().c_str()) != ARCHIVE_OK) {
    auto const err{ archive_failure("cannot create " + path.string(), handle_) };
    archive_write_free(handle_);
    handle_ = nullptr;
    throw err;
  }
}

zip_writer::~zip_writer() {
  if (handle_) { archive_write_free(handle_); }
}

void zip_writer::write_header(std::string const &archive_name, std::uint64_t size) {
  std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry{ archive_entry_new(),
                                                                        archive_entry_free };
  archive_entry_set_pathname(entry.get(), archive_name.c_str());
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
  archive_entry_set_filetype(entry.get(), AE_IFREG);
  archive_entry_set_perm(entry.get(), 0644);
  archive_entry_set_mtime(entry.get(), kFixedMtime, 0);
  if (archive_write_header(handle_, entry.get()) != ARCHIVE_OK) {
    throw archive_failure("cannot add " + archive_name + " to " + path_.string(), handle_);
  }
}

void zip_writer::add_file(std::string const &archive_name, std::filesystem::path const &source) {
  auto const file{ util_open_file(source, "rb") };
  if (!file) { throw std::runtime_error("cannot open " + source.string()); }

  write_header(archive_name, std::filesystem::file_size(source));
  std::vector<char> buffer(1024 * 1024);
  std::size_t n{ 0 };
  while ((n = std::fread(buffer.data(), 1, buffer.size(), file.get())) > 0) {
    if (archive_write_data(handle_, buffer.data(), n) < 0) {
      throw archive_failure("cannot write " + archive_name, handle_);
    }
  }
  if (std::ferror(file.get())) { throw std::runtime_error("cannot read " + source.string()); }
}

void zip_writer::add_text(std::string const &archive_name, std::string_view content) {
  write_header(archive_name, content.size());
  if (!content.empty() && archive_write_data(handle_, content.data(), content.size()) < 0) {
    throw archive_failure("cannot write " + archive_name, handle_);
  }
}

void zip_writer::close() {
  if (!handle_) { return; }
  int const rc{ archive_write_close(handle_) };
  if (rc != ARCHIVE_OK) {
    auto const err{ archive_failure("cannot finish " + path_.string(), handle_) };
    archive_write_free(handle_);
    handle_ = nullptr;
    throw err;
  }
  archive_write_free(handle_);
  handle_ = nullptr;
}

std::string pack_filename(project const &p, std::string_view group_name) {
  return p.id + "-" + p.version + "-" + std::string{ group_name } + ".zip";
}

std::filesystem::path pack_extension(project const &p, pack_request const &req) {
  req.manifest.validate();

  std::filesystem::create_directories(req.out_dir);
  auto const final_path{ req.out_dir / pack_filename(p, req.group_name) };
  auto const temp_path{ req.out_dir / ("." + final_path.filename().string() + ".tmp") };
  scoped_path_cleanup cleanup{ temp_path };

  {
    zip_writer zip{ temp_path };
    zip.add_text("blender_manifest.toml", req.manifest.to_toml());
    zip.add_text("init_settings.toml", release_profile_init_settings(req.profile));
    for (auto const &[name, source] : req.wheels) { zip.add_file("wheels/" + name, source); }
    for (auto const &[name, source] : package_files(p)) { zip.add_file(name, source); }
    zip.close();
  }

  platform::atomic_rename(temp_path, final_path);
  cleanup.reset();

  tui::info("Packed %s (%zu wheels, profile %s)",
            final_path.filename().string().c_str(),
            req.wheels.size(),
            std::string{ release_profile_name(req.profile) }.c_str());
  return final_path;
}

}  // namespace blext
