//
// Created by Giuseppe Francione on 05/12/25.
//

#include "../../include/exif_reader.hpp"
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace {

constexpr std::uint16_t kTagDateTime = 0x0132;
constexpr std::uint16_t kTagExifIfd = 0x8769;
constexpr std::uint16_t kTagDateTimeOriginal = 0x9003;
constexpr std::uint16_t kTypeAscii = 2;
constexpr std::uint16_t kTypeLong = 4;

class TiffView {
public:
    explicit TiffView(const std::span<const unsigned char> data) : data_(data) {}

    bool init() {
        if (data_.size() < 8) return false;
        if (data_[0] == 'I' && data_[1] == 'I') little_ = true;
        else if (data_[0] == 'M' && data_[1] == 'M') little_ = false;
        else return false;
        return u16(2) == 42;
    }

    [[nodiscard]] bool has(const std::size_t offset, const std::size_t len) const {
        return offset <= data_.size() && len <= data_.size() - offset;
    }

    [[nodiscard]] std::uint16_t u16(const std::size_t off) const {
        if (!has(off, 2)) return 0;
        return little_ ? static_cast<std::uint16_t>(data_[off] | data_[off + 1] << 8)
                       : static_cast<std::uint16_t>(data_[off] << 8 | data_[off + 1]);
    }

    [[nodiscard]] std::uint32_t u32(const std::size_t off) const {
        if (!has(off, 4)) return 0;
        if (little_) {
            return static_cast<std::uint32_t>(data_[off]) | static_cast<std::uint32_t>(data_[off + 1]) << 8 |
                   static_cast<std::uint32_t>(data_[off + 2]) << 16 | static_cast<std::uint32_t>(data_[off + 3]) << 24;
        }
        return static_cast<std::uint32_t>(data_[off]) << 24 | static_cast<std::uint32_t>(data_[off + 1]) << 16 |
               static_cast<std::uint32_t>(data_[off + 2]) << 8 | static_cast<std::uint32_t>(data_[off + 3]);
    }

    // locate a tag in one IFD; returns the offset of its 12-byte entry
    [[nodiscard]] std::optional<std::size_t> find_tag(const std::size_t ifd, const std::uint16_t tag) const {
        if (!has(ifd, 2)) return std::nullopt;
        const std::uint16_t count = u16(ifd);
        for (std::uint16_t i = 0; i < count; ++i) {
            const std::size_t entry = ifd + 2 + static_cast<std::size_t>(i) * 12;
            if (!has(entry, 12)) return std::nullopt;
            if (u16(entry) == tag) return entry;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string> ascii(const std::size_t entry) const {
        if (u16(entry + 2) != kTypeAscii) return std::nullopt;
        const std::uint32_t count = u32(entry + 4);
        if (count == 0) return std::nullopt;
        const std::size_t value_off = count <= 4 ? entry + 8 : u32(entry + 8);
        if (!has(value_off, count)) return std::nullopt;
        std::string out(reinterpret_cast<const char*>(data_.data() + value_off), count);
        while (!out.empty() && (out.back() == '\0' || out.back() == ' ')) out.pop_back();
        if (out.empty()) return std::nullopt;
        return out;
    }

private:
    std::span<const unsigned char> data_;
    bool little_ = true;
};

} // namespace

namespace archivist {

std::optional<Timestamp> parse_exif_timestamp(const std::string& text) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (std::sscanf(text.c_str(), "%4d:%2d:%2d %2d:%2d:%2d", &y, &mo, &d, &h, &mi, &s) != 6 &&
        std::sscanf(text.c_str(), "%4d-%2d-%2d %2d:%2d:%2d", &y, &mo, &d, &h, &mi, &s) != 6) {
        return std::nullopt;
    }
    // cameras without a clock write "0000:00:00 00:00:00"
    if (y < 1900 || mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

std::optional<ExifDate> read_exif_date(const std::span<const unsigned char> tiff) {
    TiffView view(tiff);
    if (!view.init()) return std::nullopt;

    const std::size_t ifd0 = view.u32(4);
    std::optional<std::string> raw;

    if (const auto exif_ptr = view.find_tag(ifd0, kTagExifIfd); exif_ptr && view.u16(*exif_ptr + 2) == kTypeLong) {
        if (const auto original = view.find_tag(view.u32(*exif_ptr + 8), kTagDateTimeOriginal)) {
            raw = view.ascii(*original);
        }
    }
    if (!raw) {
        if (const auto dt = view.find_tag(ifd0, kTagDateTime)) raw = view.ascii(*dt);
    }
    if (!raw) return std::nullopt;

    return ExifDate{*raw, parse_exif_timestamp(*raw)};
}

} // namespace archivist
