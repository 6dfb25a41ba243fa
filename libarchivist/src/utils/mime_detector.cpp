//
// Created by Giuseppe Francione on 03/12/25.
//
#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>

namespace {

#ifndef _WIN32
struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

unique_magic open_magic() {
    unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return nullptr;
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Warning,
                    std::string("magic_load failed: ") + (magic_error(magic.get()) ? magic_error(magic.get()) : "?"),
                    "libmagic");
        return nullptr;
    }
    return magic;
}
#endif

} // namespace

std::string archivist::MimeDetector::detect_buffer(const std::span<const unsigned char> data)
{
#ifndef _WIN32
    if (data.empty()) return {};
    const auto magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
#else
    (void)data;
    return {};
#endif
}

archivist::ImageFormat archivist::MimeDetector::detect_image_format(const std::span<const unsigned char> data,
                                                                   const std::string_view name_hint)
{
    const std::string mime = detect_buffer(data);
    if (const auto it = mime_to_image_format.find(mime); it != mime_to_image_format.end()) {
        return it->second;
    }
    return image_format_from_extension(lower_extension(name_hint));
}
