//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/image_codec.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Routes libjpeg's recoverable warnings ("Corrupt JPEG data...") to the logger.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

void install_error_handlers(JpegErrorMgr& mgr) {
    jpeg_std_error(&mgr.pub);
    mgr.pub.error_exit = jpeg_error_exit_throw;
    mgr.pub.output_message = jpeg_output_message_log;
}

/**
 * @brief RAII owner of a decompressor; destroys it even if libjpeg throws.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompress() {
        install_error_handlers(err);
        cinfo.err = &err.pub;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

/**
 * @brief RAII owner of a compressor.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};

    JpegCompress() {
        install_error_handlers(err);
        cinfo.err = &err.pub;
        jpeg_create_compress(&cinfo);
    }
    ~JpegCompress() { jpeg_destroy_compress(&cinfo); }

    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

using unique_FILE = std::unique_ptr<FILE, archivist::FileCloser>;

constexpr unsigned char kExifSignature[] = {'E', 'x', 'i', 'f', 0, 0};

// returns the TIFF block of the first APP1 marker carrying EXIF
std::vector<unsigned char> find_exif_block(const j_decompress_ptr cinfo) {
    for (jpeg_saved_marker_ptr m = cinfo->marker_list; m; m = m->next) {
        if (m->marker != JPEG_APP0 + 1 || !m->data) continue;
        if (m->data_length <= sizeof(kExifSignature)) continue;
        if (std::memcmp(m->data, kExifSignature, sizeof(kExifSignature)) != 0) continue;
        return {m->data + sizeof(kExifSignature), m->data + m->data_length};
    }
    return {};
}

unsigned int pick_scale_denom(const unsigned int width, const unsigned int height, const int min_dimension) {
    if (min_dimension <= 0) return 1;
    const auto min_dim = static_cast<unsigned int>(min_dimension);
    for (const unsigned int denom : {8u, 4u, 2u}) {
        if (width / denom >= min_dim && height / denom >= min_dim) return denom;
    }
    return 1;
}

} // namespace

namespace archivist {

DecodedImage decode_jpeg(const std::span<const unsigned char> data, const int min_dimension, const bool header_only) {
    JpegDecompress dec;
    // older libjpeg takes a non-const buffer; the data is never written
    jpeg_mem_src(&dec.cinfo, const_cast<unsigned char *>(data.data()), static_cast<unsigned long>(data.size()));
    jpeg_save_markers(&dec.cinfo, JPEG_APP0 + 1, 0xFFFF);

    if (jpeg_read_header(&dec.cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }

    DecodedImage out;
    out.width = static_cast<int>(dec.cinfo.image_width);
    out.height = static_cast<int>(dec.cinfo.image_height);
    check_image_limits(dec.cinfo.image_width, dec.cinfo.image_height);
    out.exif = find_exif_block(&dec.cinfo);

    if (header_only) return out;

    dec.cinfo.out_color_space = JCS_RGB;
    dec.cinfo.scale_num = 1;
    dec.cinfo.scale_denom = pick_scale_denom(dec.cinfo.image_width, dec.cinfo.image_height, min_dimension);

    jpeg_start_decompress(&dec.cinfo);
    if (dec.cinfo.output_components != 3) {
        throw std::runtime_error("Unexpected JPEG output component count");
    }

    out.width = static_cast<int>(dec.cinfo.output_width);
    out.height = static_cast<int>(dec.cinfo.output_height);
    const std::size_t stride = static_cast<std::size_t>(dec.cinfo.output_width) * 3;
    out.rgb.resize(stride * dec.cinfo.output_height);

    while (dec.cinfo.output_scanline < dec.cinfo.output_height) {
        JSAMPROW row = out.rgb.data() + static_cast<std::size_t>(dec.cinfo.output_scanline) * stride;
        jpeg_read_scanlines(&dec.cinfo, &row, 1);
    }
    jpeg_finish_decompress(&dec.cinfo);

    Logger::log(LogLevel::Debug,
                "JPEG decoded " + std::to_string(out.width) + "x" + std::to_string(out.height) +
                " (1/" + std::to_string(dec.cinfo.scale_denom) + ")",
                "jpeg_codec");
    return out;
}

void write_jpeg(const DecodedImage& image, const std::filesystem::path& output, const int quality) {
    if (image.width <= 0 || image.height <= 0 ||
        image.rgb.size() < static_cast<std::size_t>(image.width) * image.height * 3) {
        throw std::runtime_error("write_jpeg: empty or truncated pixel buffer");
    }

    const unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        Logger::log(LogLevel::Error, "Cannot open JPEG output: " + output.string(), "jpeg_codec");
        throw std::runtime_error("Cannot open JPEG output");
    }

    JpegCompress enc;
    jpeg_stdio_dest(&enc.cinfo, outfile.get());

    enc.cinfo.image_width = static_cast<JDIMENSION>(image.width);
    enc.cinfo.image_height = static_cast<JDIMENSION>(image.height);
    enc.cinfo.input_components = 3;
    enc.cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&enc.cinfo);
    jpeg_set_quality(&enc.cinfo, quality, TRUE);
    enc.cinfo.optimize_coding = TRUE;

    jpeg_start_compress(&enc.cinfo, TRUE);
    const std::size_t stride = static_cast<std::size_t>(image.width) * 3;
    while (enc.cinfo.next_scanline < enc.cinfo.image_height) {
        // libjpeg does not write through the row pointer
        JSAMPROW row = const_cast<unsigned char *>(image.rgb.data()) + enc.cinfo.next_scanline * stride;
        jpeg_write_scanlines(&enc.cinfo, &row, 1);
    }
    jpeg_finish_compress(&enc.cinfo);

    // explicitly flush stdio buffer to disk before returning
    if (std::fflush(outfile.get()) != 0) {
        throw std::runtime_error("fflush failed for " + output.string());
    }
}

} // namespace archivist
