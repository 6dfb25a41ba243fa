//
// Created by Giuseppe Francione on 05/12/25.
//

#ifndef ARCHIVIST_EXIF_READER_HPP
#define ARCHIVIST_EXIF_READER_HPP

#include "file_utils.hpp"
#include <optional>
#include <span>
#include <string>

namespace archivist {

    /**
     * @brief Capture date found in an EXIF block.
     */
    struct ExifDate {
        std::string raw;                    ///< "YYYY:MM:DD HH:MM:SS" as stored
        std::optional<Timestamp> date_taken; ///< set when @ref raw parses (local time)
    };

    /**
     * @brief Reads DateTimeOriginal (0x9003), falling back to DateTime (0x0132).
     *
     * @param tiff The TIFF structure following the "Exif\0\0" signature of an
     * APP1 marker. Both byte orders are handled; every offset is bounds checked.
     * @return std::nullopt if neither tag is present or the block is malformed.
     */
    std::optional<ExifDate> read_exif_date(std::span<const unsigned char> tiff);

    /**
     * @brief Parses "YYYY:MM:DD HH:MM:SS" (also accepts '-' as date separator).
     */
    std::optional<Timestamp> parse_exif_timestamp(const std::string& text);

} // namespace archivist

#endif // ARCHIVIST_EXIF_READER_HPP
