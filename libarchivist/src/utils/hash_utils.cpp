//
// Created by Giuseppe Francione on 03/12/25.
//

#include "../../include/hash_utils.hpp"
#include "../../include/random_utils.hpp"
#include <openssl/evp.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace archivist {

std::string md5_hex(const std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }
    std::ostringstream ss;
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string file_id(const std::filesystem::path& path) {
    return md5_hex(normalize_path(path).generic_string()).substr(0, 16);
}

std::string entry_id(const std::filesystem::path& archive_path, const std::string_view internal_path) {
    std::string key = normalize_path(archive_path).generic_string();
    key += '#';
    key += internal_path;
    return md5_hex(key).substr(0, 16);
}

std::string scan_history_id(const std::filesystem::path& directory, const Timestamp scan_date) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(scan_date.time_since_epoch()).count() % 1000;
    std::ostringstream stamp;
    stamp << format_local_time(scan_date) << std::setw(3) << std::setfill('0') << ms;
    // two scans in the same millisecond still get their own row
    return md5_hex(directory.generic_string() + "_" + stamp.str() + "_" + RandomUtils::random_suffix());
}

} // namespace archivist
