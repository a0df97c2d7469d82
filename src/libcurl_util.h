#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>

namespace blext {

void libcurl_ensure_initialized();

// Stream url into destination. Throws download_error on transport or HTTP failure (the
// partial file is removed). A set cancel flag aborts the transfer at the next progress tick.
std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       std::atomic_bool const *cancel = nullptr);

struct http_response {
  long status{ 0 };
  std::string body;
};

// GET into memory. Transport failures throw download_error; HTTP errors are returned.
http_response libcurl_get(std::string_view url);

}  // namespace blext
