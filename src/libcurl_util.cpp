#include "libcurl_util.h"

#include "errors.h"
#include "util.h"

#include <curl/curl.h>

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace blext {

namespace {

constexpr char kUserAgent[]{ "blext/0.1" };

// One easy handle with the options every blext request shares.
class curl_request : unmovable {
 public:
  explicit curl_request(std::string url) : url_{ std::move(url) } {
    libcurl_ensure_initialized();
    handle_.reset(curl_easy_init());
    if (!handle_) { throw std::runtime_error("curl_easy_init failed"); }
    set(CURLOPT_URL, url_.c_str());
    set(CURLOPT_FOLLOWLOCATION, 1L);
    set(CURLOPT_NOSIGNAL, 1L);
    set(CURLOPT_USERAGENT, kUserAgent);
  }

  template <typename T>
  void set(CURLoption option, T value) {
    if (CURLcode const rc{ curl_easy_setopt(handle_.get(), option, value) }; rc != CURLE_OK) {
      throw std::runtime_error(std::string{ "curl_easy_setopt failed: " } + curl_easy_strerror(rc));
    }
  }

  CURLcode perform() { return curl_easy_perform(handle_.get()); }

  long status() {
    long code{ 0 };
    if (curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &code) != CURLE_OK) {
      throw download_error(url_, "no HTTP status in response");
    }
    return code;
  }

  std::string const &url() const { return url_; }

 private:
  struct cleanup {
    void operator()(CURL *h) const noexcept { curl_easy_cleanup(h); }
  };

  std::string url_;
  std::unique_ptr<CURL, cleanup> handle_;
};

size_t append_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t append_to_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto &out{ *static_cast<std::ofstream *>(userdata) };
  out.write(ptr, static_cast<std::streamsize>(size * nmemb));
  return out ? size * nmemb : 0;
}

int abort_if_cancelled(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto const *cancel{ static_cast<std::atomic_bool const *>(userdata) };
  return cancel && cancel->load() ? 1 : 0;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (CURLcode const rc{ curl_global_init(CURL_GLOBAL_DEFAULT) }; rc != CURLE_OK) {
      throw std::runtime_error(std::string{ "curl_global_init failed: " } + curl_easy_strerror(rc));
    }
  });
}

std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       std::atomic_bool const *cancel) {
  if (destination.empty()) { throw std::invalid_argument("libcurl_download: destination is empty"); }
  auto const target{ std::filesystem::absolute(destination).lexically_normal() };
  std::filesystem::create_directories(target.parent_path());

  std::ofstream out{ target, std::ios::binary | std::ios::trunc };
  if (!out) { throw std::runtime_error("libcurl_download: cannot open " + target.string()); }

  curl_request request{ std::string{ url } };
  request.set(CURLOPT_FAILONERROR, 1L);
  request.set(CURLOPT_WRITEFUNCTION, append_to_file);
  request.set(CURLOPT_WRITEDATA, &out);
  request.set(CURLOPT_NOPROGRESS, 0L);
  request.set(CURLOPT_XFERINFOFUNCTION, abort_if_cancelled);
  request.set(CURLOPT_XFERINFODATA, cancel);

  CURLcode const rc{ request.perform() };
  out.close();
  if (rc != CURLE_OK || !out) {
    std::error_code ec;
    std::filesystem::remove(target, ec);  // partial download
    if (rc == CURLE_OK) { throw download_error(request.url(), "failed to write " + target.string()); }
    throw download_error(request.url(),
                         rc == CURLE_ABORTED_BY_CALLBACK ? "cancelled" : curl_easy_strerror(rc));
  }
  return target;
}

http_response libcurl_get(std::string_view url) {
  curl_request request{ std::string{ url } };
  http_response response;
  request.set(CURLOPT_ACCEPT_ENCODING, "");
  request.set(CURLOPT_WRITEFUNCTION, append_to_string);
  request.set(CURLOPT_WRITEDATA, &response.body);

  if (CURLcode const rc{ request.perform() }; rc != CURLE_OK) {
    throw download_error(request.url(), curl_easy_strerror(rc));
  }
  response.status = request.status();
  return response;
}

}  // namespace blext
