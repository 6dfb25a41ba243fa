//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <system_error>
#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace archivist {

    namespace fs = std::filesystem;

    FILE* open_file(const fs::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = fs::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }
        // prefix bypasses MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file_bytes(const fs::path& path) {
        std::unique_ptr<FILE, FileCloser> f(open_file(path, "rb"));
        if (!f) {
            throw std::runtime_error("Cannot open file: " + path.string());
        }
        std::vector<unsigned char> data;
        std::vector<unsigned char> chunk(64 * 1024);
        size_t n = 0;
        while ((n = std::fread(chunk.data(), 1, chunk.size(), f.get())) > 0) {
            data.insert(data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        }
        if (std::ferror(f.get())) {
            throw std::runtime_error("Read error on file: " + path.string());
        }
        return data;
    }

    std::vector<unsigned char> read_file_head(const fs::path& path, const std::size_t max_bytes) {
        std::unique_ptr<FILE, FileCloser> f(open_file(path, "rb"));
        if (!f) {
            throw std::runtime_error("Cannot open file: " + path.string());
        }
        std::vector<unsigned char> data(max_bytes);
        const size_t n = std::fread(data.data(), 1, data.size(), f.get());
        data.resize(n);
        return data;
    }

    std::optional<FileStat> stat_file(const fs::path& path) {
#ifndef _WIN32
        struct stat st{};
        if (::stat(path.string().c_str(), &st) != 0) {
            return std::nullopt;
        }
        FileStat out;
        out.size = static_cast<std::uintmax_t>(st.st_size);
        out.modified_at = std::chrono::system_clock::from_time_t(st.st_mtime);
        out.created_at = std::chrono::system_clock::from_time_t(st.st_ctime);
        return out;
#else
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec) return std::nullopt;
        const auto ftime = fs::last_write_time(path, ec);
        if (ec) return std::nullopt;
        FileStat out;
        out.size = size;
        out.modified_at = std::chrono::clock_cast<std::chrono::system_clock>(ftime);
        out.created_at = out.modified_at;
        return out;
#endif
    }

    std::string to_lower_copy(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    bool iequals(const std::string_view a, const std::string_view b) {
        return std::ranges::equal(a, b, [](const unsigned char c1, const unsigned char c2) {
            return std::tolower(c1) == std::tolower(c2);
        });
    }

    bool iless(const std::string_view a, const std::string_view b) {
        return std::ranges::lexicographical_compare(a, b, [](const unsigned char c1, const unsigned char c2) {
            return std::tolower(c1) < std::tolower(c2);
        });
    }

    fs::path normalize_path(const fs::path& path) {
        std::error_code ec;
        auto abs = fs::absolute(path, ec);
        if (ec) abs = path;
        auto norm = abs.lexically_normal();
        // drop a trailing separator so "/a/b/" and "/a/b" compare equal
        if (!norm.has_filename() && norm.has_parent_path() && norm != norm.root_path()) {
            norm = norm.parent_path();
        }
        return norm;
    }

    bool is_same_or_under(const fs::path& path, const fs::path& root) {
        const std::string p = to_lower_copy(normalize_path(path).generic_string());
        std::string r = to_lower_copy(normalize_path(root).generic_string());
        if (p == r) return true;
        if (!r.empty() && r.back() != '/') r.push_back('/');
        return p.size() > r.size() && p.compare(0, r.size(), r) == 0;
    }

    std::string format_local_time(const Timestamp ts, const char* pattern) {
        const std::time_t t = std::chrono::system_clock::to_time_t(ts);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        char buf[64];
        const size_t n = std::strftime(buf, sizeof(buf), pattern, &tm);
        return std::string(buf, n);
    }

    fs::path make_temp_sibling(const fs::path& target) {
        return target.parent_path() /
               ("." + target.filename().string() + ".tmp_" + RandomUtils::random_suffix());
    }

    std::uintmax_t directory_size(const fs::path& dir) {
        std::uintmax_t total = 0;
        std::error_code ec;
        if (!fs::exists(dir, ec)) return 0;
        for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code ec2;
            if (it->is_regular_file(ec2)) {
                const auto sz = it->file_size(ec2);
                if (!ec2) total += sz;
            }
        }
        if (ec) {
            Logger::log(LogLevel::Warning, "Directory walk failed: " + dir.string() + " (" + ec.message() + ")", "file_utils");
        }
        return total;
    }

} // namespace archivist
