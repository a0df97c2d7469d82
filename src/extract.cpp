#include "extract.h"

#include "tui.h"

#include <archive.h>
#include <archive_entry.h>

#include <array>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace blext {
namespace {

struct read_closer {
  void operator()(archive *a) const noexcept {
    archive_read_close(a);
    archive_read_free(a);
  }
};

struct write_closer {
  void operator()(archive *a) const noexcept {
    archive_write_close(a);
    archive_write_free(a);
  }
};

using reader_ptr = std::unique_ptr<archive, read_closer>;
using writer_ptr = std::unique_ptr<archive, write_closer>;

[[noreturn]] void fail(std::string_view what, archive *a) {
  char const *detail{ a ? archive_error_string(a) : nullptr };
  throw std::runtime_error(std::string{ what } + ": " + (detail ? detail : "unknown error"));
}

reader_ptr open_reader(std::filesystem::path const &archive_path) {
  reader_ptr reader{ archive_read_new() };
  if (!reader) { throw std::runtime_error("archive_read_new failed"); }
  archive_read_support_filter_all(reader.get());
  archive_read_support_format_all(reader.get());
  if (archive_read_open_filename(reader.get(), archive_path.c_str(), 64 * 1024) != ARCHIVE_OK) {
    fail("Failed to open archive " + archive_path.string(), reader.get());
  }
  return reader;
}

writer_ptr open_disk_writer() {
  writer_ptr writer{ archive_write_disk_new() };
  if (!writer) { throw std::runtime_error("archive_write_disk_new failed"); }
  archive_write_disk_set_options(writer.get(),
                                 ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);
  archive_write_disk_set_standard_lookup(writer.get());
  return writer;
}

// Drops the first `count` components; nullopt when nothing is left.
std::optional<std::filesystem::path> strip_leading(std::string_view entry_path, int count) {
  std::filesystem::path rest;
  int skipped{ 0 };
  for (auto const &part : std::filesystem::path{ entry_path }.relative_path()) {
    if (skipped < count) {
      ++skipped;
    } else {
      rest /= part;
    }
  }
  if (skipped < count || rest.empty()) { return std::nullopt; }
  return rest;
}

void copy_entry_data(archive *reader, archive *writer) {
  std::array<char, 256 * 1024> chunk;
  for (;;) {
    la_ssize_t const n{ archive_read_data(reader, chunk.data(), chunk.size()) };
    if (n == 0) { return; }
    if (n < 0) { fail("Failed to read entry data", reader); }
    if (archive_write_data(writer, chunk.data(), static_cast<size_t>(n)) < 0) {
      fail("Failed to write entry data", writer);
    }
  }
}

}  // namespace

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options) {
  auto const reader{ open_reader(archive_path) };
  auto const writer{ open_disk_writer() };

  std::uint64_t files{ 0 };
  archive_entry *entry{ nullptr };
  for (int rc; (rc = archive_read_next_header(reader.get(), &entry)) != ARCHIVE_EOF;) {
    if (rc != ARCHIVE_OK) { fail("Failed to read archive header", reader.get()); }

    char const *name{ archive_entry_pathname(entry) };
    auto const stripped{ name ? strip_leading(name, options.strip_components) : std::nullopt };
    if (!stripped) { continue; }

    auto const relative{ stripped->lexically_normal() };
    if (relative.is_absolute() || *relative.begin() == "..") {
      throw std::runtime_error("Archive entry escapes destination: " + stripped->string());
    }

    auto const target{ destination / relative };
    std::filesystem::create_directories(target.parent_path());
    archive_entry_copy_pathname(entry, target.c_str());
    if (char const *hardlink{ archive_entry_hardlink(entry) }) {
      auto const link{ strip_leading(hardlink, options.strip_components) };
      archive_entry_copy_hardlink(
          entry, (destination / link.value_or(std::filesystem::path{ hardlink })).c_str());
    }

    if (int const wrc{ archive_write_header(writer.get(), entry) };
        wrc != ARCHIVE_OK && wrc != ARCHIVE_WARN) {
      fail("Failed to write entry header", writer.get());
    }
    if (archive_entry_size(entry) > 0) { copy_entry_data(reader.get(), writer.get()); }
    if (archive_write_finish_entry(writer.get()) != ARCHIVE_OK) {
      fail("Failed to finish entry", writer.get());
    }

    if (archive_entry_filetype(entry) == AE_IFREG) { ++files; }
  }

  if (files == 0) {
    throw std::runtime_error("Archive extraction failed: 0 files extracted from " +
                             archive_path.filename().string());
  }
  tui::debug("extracted %llu files from %s",
             static_cast<unsigned long long>(files),
             archive_path.string().c_str());
  return files;
}

bool extract_is_archive_extension(std::filesystem::path const &path) {
  constexpr std::array<std::string_view, 7> kSuffixes{
    ".zip", ".tar", ".tgz", ".tar.gz", ".tar.xz", ".tar.bz2", ".tar.zst"
  };
  auto const name{ path.filename().string() };
  for (auto const suffix : kSuffixes) {
    if (name.size() > suffix.size() && name.ends_with(suffix)) { return true; }
  }
  return false;
}

}  // namespace blext
