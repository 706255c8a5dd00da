#include "../../include/png_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <vector>

namespace {

    void png_decode_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng (decode): ") + msg, "libpng");
        throw shrink::DecodeError(msg);
    }

    void png_encode_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng (encode): ") + msg, "libpng");
        throw shrink::EncodeError(msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    /**
     * @brief Color management and text chunks worth carrying over.
     *
     * Copied out of the read struct so the write side does not depend on
     * its lifetime.
     */
    struct PngMetadata {
        bool has_srgb = false;
        int srgb_intent = 0;
        bool has_gamma = false;
        double gamma = 0.0;
        bool has_iccp = false;
        std::string iccp_name;
        std::vector<png_byte> iccp_profile;
        struct Text {
            std::string key;
            std::string text;
        };
        std::vector<Text> texts;
    };

    PngMetadata read_metadata(png_structp png, png_infop info) {
        PngMetadata meta;
        if (png_get_valid(png, info, PNG_INFO_sRGB)) {
            meta.has_srgb = png_get_sRGB(png, info, &meta.srgb_intent) != 0;
        }
        if (png_get_valid(png, info, PNG_INFO_gAMA)) {
            meta.has_gamma = png_get_gAMA(png, info, &meta.gamma) != 0;
        }
        if (png_get_valid(png, info, PNG_INFO_iCCP)) {
            png_charp name = nullptr;
            int comp_type = 0;
            png_bytep profile = nullptr;
            png_uint_32 profile_len = 0;
            if (png_get_iCCP(png, info, &name, &comp_type, &profile, &profile_len) && profile) {
                meta.has_iccp = true;
                meta.iccp_name = name ? name : "ICC";
                meta.iccp_profile.assign(profile, profile + profile_len);
            }
        }
        png_textp text = nullptr;
        int num_text = 0;
        png_get_text(png, info, &text, &num_text);
        for (int i = 0; i < num_text; ++i) {
            if (text[i].key && text[i].text) {
                meta.texts.push_back({text[i].key, std::string(text[i].text, text[i].text_length)});
            }
        }
        return meta;
    }

    void write_metadata(png_structp png, png_infop info, const PngMetadata& meta) {
        if (meta.has_iccp) {
            png_set_iCCP(png, info, meta.iccp_name.c_str(), PNG_COMPRESSION_TYPE_BASE,
                         meta.iccp_profile.data(), static_cast<png_uint_32>(meta.iccp_profile.size()));
        } else if (meta.has_srgb) {
            png_set_sRGB(png, info, meta.srgb_intent);
        }
        if (meta.has_gamma) {
            png_set_gAMA(png, info, meta.gamma);
        }
        if (!meta.texts.empty()) {
            std::vector<png_text> chunks(meta.texts.size());
            for (size_t i = 0; i < meta.texts.size(); ++i) {
                std::memset(&chunks[i], 0, sizeof(png_text));
                chunks[i].compression = PNG_TEXT_COMPRESSION_zTXt;
                chunks[i].key = const_cast<png_charp>(meta.texts[i].key.c_str());
                chunks[i].text = const_cast<png_charp>(meta.texts[i].text.c_str());
                chunks[i].text_length = meta.texts[i].text.size();
            }
            png_set_text(png, info, chunks.data(), static_cast<int>(chunks.size()));
        }
    }

    /**
     * @brief Reads and decodes a PNG into a standard 8-bit RGBA buffer.
     */
    std::vector<unsigned char> read_to_rgba8(png_structp png, png_infop info,
                                             png_uint_32& width, png_uint_32& height) {
        int bit_depth, color_type;
        png_get_IHDR(png, info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        if (bit_depth == 16) png_set_strip_16(png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
        if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
        png_set_interlace_handling(png);

        png_read_update_info(png, info);

        const size_t rowbytes = png_get_rowbytes(png, info);
        if (rowbytes != static_cast<size_t>(width) * 4) {
            throw shrink::DecodeError("unexpected row size after RGBA8 conversion");
        }

        std::vector<unsigned char> image(rowbytes * height);
        std::vector<png_bytep> row_pointers(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            row_pointers[y] = image.data() + y * rowbytes;
        }

        png_read_image(png, row_pointers.data());
        png_read_end(png, nullptr);
        return image;
    }

    /// Pixels ready for png_write_image, in the layout named by color_type.
    struct ReducedImage {
        std::vector<unsigned char> pixels;
        int color_type = PNG_COLOR_TYPE_RGB_ALPHA;
        int channels = 4;
        std::vector<png_color> palette;  ///< Only for PNG_COLOR_TYPE_PALETTE
        std::vector<png_byte> trans;     ///< tRNS alpha per palette entry, empty when opaque
    };

    constexpr uint32_t pack_rgba(const unsigned char r, const unsigned char g,
                                 const unsigned char b, const unsigned char a) {
        return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16) |
               (static_cast<uint32_t>(b) << 8) | a;
    }

    /**
     * @brief Repacks RGBA8 pixels into the smallest of gray, palette,
     * gray+alpha, RGB or RGBA that represents them exactly.
     *
     * A palette is used when the image has at most 256 distinct RGBA
     * values, so indexed sources stay indexed.
     */
    ReducedImage reduce_channels(const std::vector<unsigned char>& rgba) {
        bool all_gray = true;
        bool all_opaque = true;
        bool can_use_palette = true;
        std::map<uint32_t, png_byte> color_to_index;
        ReducedImage out;

        for (size_t i = 0; i + 3 < rgba.size(); i += 4) {
            const unsigned char r = rgba[i], g = rgba[i + 1], b = rgba[i + 2], a = rgba[i + 3];
            if (r != g || r != b) all_gray = false;
            if (a != 0xFF) all_opaque = false;

            if (can_use_palette) {
                const uint32_t color = pack_rgba(r, g, b, a);
                if (color_to_index.find(color) == color_to_index.end()) {
                    if (color_to_index.size() >= 256) {
                        can_use_palette = false;
                    } else {
                        color_to_index.emplace(color, static_cast<png_byte>(color_to_index.size()));
                        out.palette.push_back({r, g, b});
                        out.trans.push_back(a);
                    }
                }
            }
        }

        if (all_gray && all_opaque) {
            out.color_type = PNG_COLOR_TYPE_GRAY;
            out.channels = 1;
        } else if (can_use_palette) {
            out.color_type = PNG_COLOR_TYPE_PALETTE;
            out.channels = 1;
        } else if (all_gray) {
            out.color_type = PNG_COLOR_TYPE_GRAY_ALPHA;
            out.channels = 2;
        } else if (all_opaque) {
            out.color_type = PNG_COLOR_TYPE_RGB;
            out.channels = 3;
        } else {
            out.pixels = rgba;
            out.palette.clear();
            out.trans.clear();
            return out;
        }

        if (out.color_type != PNG_COLOR_TYPE_PALETTE) {
            out.palette.clear();
            out.trans.clear();
        } else if (all_opaque) {
            out.trans.clear();
        }

        out.pixels.reserve(rgba.size() / 4 * out.channels);
        for (size_t i = 0; i + 3 < rgba.size(); i += 4) {
            switch (out.color_type) {
                case PNG_COLOR_TYPE_GRAY:
                    out.pixels.push_back(rgba[i]);
                    break;
                case PNG_COLOR_TYPE_PALETTE:
                    out.pixels.push_back(color_to_index.at(pack_rgba(rgba[i], rgba[i + 1], rgba[i + 2], rgba[i + 3])));
                    break;
                case PNG_COLOR_TYPE_GRAY_ALPHA:
                    out.pixels.push_back(rgba[i]);
                    out.pixels.push_back(rgba[i + 3]);
                    break;
                default:
                    out.pixels.push_back(rgba[i]);
                    out.pixels.push_back(rgba[i + 1]);
                    out.pixels.push_back(rgba[i + 2]);
                    break;
            }
        }
        return out;
    }

} // namespace

namespace shrink {

    void PngCodec::recompress(const std::filesystem::path &input,
                              const std::filesystem::path &output,
                              [[maybe_unused]] const int quality) const {
        Logger::log(LogLevel::Debug, "Start PNG recompression: " + input.string(), "png_codec");

        // --- decode ---
        unique_FILE fp_in(open_file(input, "rb"));
        if (!fp_in) {
            throw DecodeError("cannot open PNG input");
        }

        std::array<png_byte, 8> signature{};
        if (std::fread(signature.data(), 1, signature.size(), fp_in.get()) != signature.size() ||
            png_sig_cmp(signature.data(), 0, signature.size()) != 0) {
            throw DecodeError("not a PNG file");
        }

        PngRead rd;
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_decode_error_fn, png_warning_fn);
        if (!rd.png) throw DecodeError("png_create_read_struct failed");
        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) throw DecodeError("png_create_info_struct failed");

        png_init_io(rd.png, fp_in.get());
        png_set_sig_bytes(rd.png, static_cast<int>(signature.size()));
        png_read_info(rd.png, rd.info);

        png_uint_32 width = 0, height = 0;
        const PngMetadata meta = read_metadata(rd.png, rd.info);
        const std::vector<unsigned char> rgba = read_to_rgba8(rd.png, rd.info, width, height);
        fp_in.reset();

        const ReducedImage reduced = reduce_channels(rgba);

        Logger::log(LogLevel::Debug,
                    "Decoded " + std::to_string(width) + "x" + std::to_string(height) + " PNG, writing " +
                    (reduced.color_type == PNG_COLOR_TYPE_PALETTE
                         ? "a " + std::to_string(reduced.palette.size()) + " color palette"
                         : std::to_string(reduced.channels) + " channel(s)"),
                    "png_codec");

        // --- encode ---
        unique_FILE fp_out(open_file(output, "wb"));
        if (!fp_out) {
            throw EncodeError("cannot open PNG output");
        }

        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_encode_error_fn, png_warning_fn);
        if (!wr.png) throw EncodeError("png_create_write_struct failed");
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw EncodeError("png_create_info_struct failed");

        png_init_io(wr.png, fp_out.get());
        png_set_compression_level(wr.png, Z_BEST_COMPRESSION);
        // indexed rows are written unfiltered
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE,
                       reduced.color_type == PNG_COLOR_TYPE_PALETTE ? PNG_FILTER_NONE : PNG_ALL_FILTERS);

        png_set_IHDR(wr.png, wr.info, width, height, 8, reduced.color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
        if (reduced.color_type == PNG_COLOR_TYPE_PALETTE) {
            png_set_PLTE(wr.png, wr.info, reduced.palette.data(), static_cast<int>(reduced.palette.size()));
            if (!reduced.trans.empty()) {
                png_set_tRNS(wr.png, wr.info, reduced.trans.data(), static_cast<int>(reduced.trans.size()), nullptr);
            }
        }
        write_metadata(wr.png, wr.info, meta);
        png_write_info(wr.png, wr.info);

        const size_t stride = static_cast<size_t>(width) * reduced.channels;
        std::vector<png_bytep> rows(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            rows[y] = const_cast<png_bytep>(reduced.pixels.data() + y * stride);
        }
        png_write_image(wr.png, rows.data());
        png_write_end(wr.png, nullptr);

        if (std::fflush(fp_out.get()) != 0 || std::ferror(fp_out.get())) {
            throw EncodeError("write failed for PNG output");
        }
        fp_out.reset();

        Logger::log(LogLevel::Debug, "PNG recompression completed: " + output.string(), "png_codec");
    }

} // namespace shrink
