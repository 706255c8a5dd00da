/**
 * @file png_codec.hpp
 * @brief ICodec implementation for PNG files.
 */

#ifndef SHRINK_PNG_CODEC_HPP
#define SHRINK_PNG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace shrink {

    /**
     * @brief Lossless PNG recompression with libpng and zlib.
     *
     * @details The image is decoded to 8-bit RGBA, then written back at
     * the maximum zlib level with adaptive filtering, dropping the alpha
     * channel when every pixel is opaque and the color channels when every
     * pixel is gray. PNG is lossless, so the quality argument is ignored.
     * Color management chunks (iCCP, sRGB, gAMA) and text chunks are kept.
     */
    class PngCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PNG";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        void recompress(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        int quality) const override;
    };

} // namespace shrink

#endif // SHRINK_PNG_CODEC_HPP
