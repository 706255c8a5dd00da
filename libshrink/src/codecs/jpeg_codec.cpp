#include "../../include/jpeg_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <string>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

std::string format_jpeg_message(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    return err->msg;
}

void jpeg_decode_error_exit(const j_common_ptr cinfo) {
    const auto msg = format_jpeg_message(cinfo);
    Logger::log(LogLevel::Debug, "libjpeg (decode): " + msg, "libjpeg");
    throw shrink::DecodeError(msg);
}

void jpeg_encode_error_exit(const j_common_ptr cinfo) {
    const auto msg = format_jpeg_message(cinfo);
    Logger::log(LogLevel::Debug, "libjpeg (encode): " + msg, "libjpeg");
    throw shrink::EncodeError(msg);
}

// corrupt-data warnings are not fatal for libjpeg; keep them out of the console
void jpeg_output_message_to_log(const j_common_ptr cinfo) {
    Logger::log(LogLevel::Debug, "libjpeg: " + format_jpeg_message(cinfo), "libjpeg");
}

/**
 * @brief Owns a decompress struct and destroys it on scope exit.
 */
struct JpegDecompress {
    jpeg_decompress_struct info{};
    JpegErrorMgr err{};

    JpegDecompress() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_decode_error_exit;
        err.pub.output_message = jpeg_output_message_to_log;
        jpeg_create_decompress(&info);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&info); }
    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

struct JpegCompress {
    jpeg_compress_struct info{};
    JpegErrorMgr err{};

    JpegCompress() {
        info.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_encode_error_exit;
        err.pub.output_message = jpeg_output_message_to_log;
        jpeg_create_compress(&info);
    }
    ~JpegCompress() { jpeg_destroy_compress(&info); }
    JpegCompress(const JpegCompress&) = delete;
    JpegCompress& operator=(const JpegCompress&) = delete;
};

struct SavedMarker {
    int marker;
    std::vector<JOCTET> data;
};

/**
 * @brief Tells libjpeg to keep APPn and COM markers in memory.
 */
void setup_marker_saving(const j_decompress_ptr srcinfo) {
    for (int m = 0; m < 16; ++m) {
        jpeg_save_markers(srcinfo, JPEG_APP0 + m, 0xFFFF);
    }
    jpeg_save_markers(srcinfo, JPEG_COM, 0xFFFF);
}

/**
 * @brief Copies the saved markers out of the decompressor.
 *
 * JFIF (APP0) and Adobe (APP14) are skipped: jpeg_start_compress writes
 * its own and duplicates confuse some readers.
 */
std::vector<SavedMarker> collect_saved_markers(const j_decompress_ptr srcinfo) {
    std::vector<SavedMarker> markers;
    for (jpeg_saved_marker_ptr m = srcinfo->marker_list; m; m = m->next) {
        if (m->marker == JPEG_APP0 || m->marker == JPEG_APP0 + 14) continue;
        if (m->data && m->data_length > 0) {
            markers.push_back({m->marker, {m->data, m->data + m->data_length}});
        }
    }
    return markers;
}

} // namespace

namespace shrink {

void JpegCodec::recompress(const std::filesystem::path& input,
                           const std::filesystem::path& output,
                           const int quality) const {
    Logger::log(LogLevel::Debug, "Start JPEG recompression: " + input.string(), "jpeg_codec");

    unique_FILE infile(open_file(input, "rb"));
    if (!infile) {
        throw DecodeError("cannot open JPEG input");
    }

    // --- decode ---
    JpegDecompress src;
    jpeg_stdio_src(&src.info, infile.get());
    setup_marker_saving(&src.info);

    if (jpeg_read_header(&src.info, TRUE) != JPEG_HEADER_OK) {
        throw DecodeError("invalid JPEG header");
    }
    const bool progressive = src.info.progressive_mode;

    jpeg_start_decompress(&src.info);
    const JDIMENSION width = src.info.output_width;
    const JDIMENSION height = src.info.output_height;
    const int components = src.info.output_components;
    const J_COLOR_SPACE color_space = src.info.out_color_space;

    const size_t row_stride = static_cast<size_t>(width) * components;
    std::vector<JSAMPLE> pixels(row_stride * height);
    while (src.info.output_scanline < height) {
        JSAMPROW row = pixels.data() + static_cast<size_t>(src.info.output_scanline) * row_stride;
        jpeg_read_scanlines(&src.info, &row, 1);
    }
    auto markers = collect_saved_markers(&src.info);
    jpeg_finish_decompress(&src.info);
    infile.reset();

    Logger::log(LogLevel::Debug,
                "Decoded " + std::to_string(width) + "x" + std::to_string(height) +
                " JPEG (" + (progressive ? "progressive" : "baseline") + ")",
                "jpeg_codec");

    // --- encode ---
    unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        throw EncodeError("cannot open JPEG output");
    }

    JpegCompress dst;
    jpeg_stdio_dest(&dst.info, outfile.get());
    dst.info.image_width = width;
    dst.info.image_height = height;
    dst.info.input_components = components;
    dst.info.in_color_space = color_space;
    jpeg_set_defaults(&dst.info);
    jpeg_set_quality(&dst.info, quality, TRUE);
    dst.info.optimize_coding = TRUE;
    if (progressive) {
        jpeg_simple_progression(&dst.info);
    }

    jpeg_start_compress(&dst.info, TRUE);
    for (const auto& m : markers) {
        jpeg_write_marker(&dst.info, m.marker, m.data.data(), static_cast<unsigned int>(m.data.size()));
    }
    while (dst.info.next_scanline < height) {
        JSAMPROW row = pixels.data() + static_cast<size_t>(dst.info.next_scanline) * row_stride;
        jpeg_write_scanlines(&dst.info, &row, 1);
    }
    jpeg_finish_compress(&dst.info);

    if (std::fflush(outfile.get()) != 0 || std::ferror(outfile.get())) {
        throw EncodeError("write failed for JPEG output");
    }
    outfile.reset();

    Logger::log(LogLevel::Debug, "JPEG recompression completed: " + output.string(), "jpeg_codec");
}

} // namespace shrink
