#include "sha256.h"

#include "util.h"

#include <mbedtls/sha256.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace blext {

namespace {

class sha256_stream : unmovable {
 public:
  sha256_stream() {
    mbedtls_sha256_init(&ctx_);
    check(mbedtls_sha256_starts(&ctx_, 0), "starts");
  }
  ~sha256_stream() { mbedtls_sha256_free(&ctx_); }

  void update(unsigned char const *data, size_t length) {
    check(mbedtls_sha256_update(&ctx_, data, length), "update");
  }

  sha256_t finish() {
    sha256_t digest{};
    check(mbedtls_sha256_finish(&ctx_, digest.data()), "finish");
    return digest;
  }

 private:
  static void check(int rc, char const *step) {
    if (rc != 0) { throw std::runtime_error(std::string{ "sha256: mbedtls_sha256_" } + step + " failed"); }
  }

  mbedtls_sha256_context ctx_;
};

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  auto const file{ util_open_file(file_path, "rb") };
  if (!file) { throw std::runtime_error("sha256: cannot open " + file_path.string()); }

  sha256_stream hasher;
  std::vector<unsigned char> chunk(512 * 1024);
  while (size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) }) {
    hasher.update(chunk.data(), n);
  }
  if (std::ferror(file.get())) { throw std::runtime_error("sha256: read failed: " + file_path.string()); }
  return hasher.finish();
}

sha256_t sha256(void const *data, size_t length) {
  sha256_stream hasher;
  hasher.update(static_cast<unsigned char const *>(data), length);
  return hasher.finish();
}

std::string sha256_hex(sha256_t const &digest) {
  return util_bytes_to_hex(digest.data(), digest.size());
}

bool sha256_matches(std::string_view expected_hex, sha256_t const &actual_hash) {
  if (expected_hex.size() != actual_hash.size() * 2) {
    throw std::runtime_error(
        "sha256_matches: expected hex string must be 64 characters, got " +
        std::to_string(expected_hex.size()));
  }
  return std::ranges::equal(util_hex_to_bytes(std::string{ expected_hex }), actual_hash);
}

}  // namespace blext
