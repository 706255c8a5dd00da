/**
 * @file jpeg_codec.hpp
 * @brief ICodec implementation for JPEG files.
 */

#ifndef SHRINK_JPEG_CODEC_HPP
#define SHRINK_JPEG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace shrink {

    /**
     * @brief Lossy JPEG recompression with libjpeg.
     *
     * @details Decodes the image to scanlines and encodes it again at the
     * requested quality with optimized Huffman tables. Progressive input
     * stays progressive. APPn and COM markers (EXIF, ICC, XMP, comments)
     * are carried over unchanged.
     */
    class JpegCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JPEG";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/jpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        /**
         * @throws DecodeError if libjpeg cannot read the input.
         * @throws EncodeError if the output cannot be opened or encoded.
         */
        void recompress(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        int quality) const override;
    };

} // namespace shrink

#endif // SHRINK_JPEG_CODEC_HPP
