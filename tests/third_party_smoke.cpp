#include <git2.h>
#include <curl/curl.h>
#include <archive.h>
#include <archive_entry.h>
#include <blake3.h>
#include <mbedtls/sha256.h>
#include <nlohmann/json.hpp>
#include <tbb/global_control.h>
#include <toml++/toml.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

int main() {
    if (git_libgit2_init() < 0) {
        return 1;
    }
    const auto features = git_libgit2_features();
    git_libgit2_shutdown();
    if ((features & GIT_FEATURE_HTTPS) == 0) {
        return 1;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return 1;
    }
    const curl_version_info_data *info = curl_version_info(CURLVERSION_NOW);
    if (!info || (info->features & CURL_VERSION_SSL) == 0U) {
        curl_global_cleanup();
        return 1;
    }
    curl_global_cleanup();

    tbb::global_control control(tbb::global_control::max_allowed_parallelism, 2);

    archive *writer = archive_write_new();
    if (!writer) {
        return 1;
    }
    if (archive_write_set_format_zip(writer) != ARCHIVE_OK) {
        archive_write_free(writer);
        return 1;
    }
    archive_write_free(writer);

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    std::array<uint8_t, BLAKE3_OUT_LEN> digest{};
    blake3_hasher_finalize(&hasher, digest.data(), digest.size());

    static constexpr std::string_view sha_msg = "abc";
    std::array<unsigned char, 32> sha{};
    if (mbedtls_sha256(reinterpret_cast<const unsigned char *>(sha_msg.data()),
                       sha_msg.size(), sha.data(), 0) != 0) {
        return 1;
    }
    static constexpr std::array<unsigned char, 4> sha_prefix{0xba, 0x78, 0x16, 0xbf};
    if (!std::equal(sha_prefix.begin(), sha_prefix.end(), sha.begin())) {
        return 1;
    }

    const auto table = toml::parse("[tool.blext]\npretty_name = \"Smoke\"\n");
    if (table["tool"]["blext"]["pretty_name"].value_or(std::string_view{}) != "Smoke") {
        return 1;
    }

    const auto json = nlohmann::json::parse(R"({"ok": true})");
    if (!json.at("ok").get<bool>()) {
        return 1;
    }

    return 0;
}
