//
// Created by Giuseppe Francione on 03/12/25.
//

#ifndef ARCHIVIST_MIME_DETECTOR_HPP
#define ARCHIVIST_MIME_DETECTOR_HPP

#include "media_types.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace archivist {

    /**
     * @brief Content-based type sniffing backed by libmagic.
     *
     * Extensions inside archives are often wrong (a ".jpg" that is really a
     * PNG); the full-decode paths ask this class which decoder to use and
     * fall back to the extension when libmagic has no answer.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @param data Bytes to inspect (usually a whole decoded entry).
         * @return The MIME type, or an empty string.
         */
        static std::string detect_buffer(std::span<const unsigned char> data);

        /**
         * @brief Image format of a buffer by content, falling back to the
         * extension of @p name_hint when libmagic reports no image type.
         */
        static ImageFormat detect_image_format(std::span<const unsigned char> data, std::string_view name_hint);
    };

} // namespace archivist
#endif //ARCHIVIST_MIME_DETECTOR_HPP
