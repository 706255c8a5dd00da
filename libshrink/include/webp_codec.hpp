/**
 * @file webp_codec.hpp
 * @brief ICodec implementation for WebP files.
 */

#ifndef SHRINK_WEBP_CODEC_HPP
#define SHRINK_WEBP_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <string_view>
#include <span>

namespace shrink {

    /**
     * @brief Lossy WebP recompression with libwebp.
     *
     * @details Decodes to RGBA and encodes again at the requested quality.
     * Animated WebP is rejected as a decode failure. EXIF, XMP and ICC
     * chunks are carried over through the mux API.
     */
    class WebpCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebP";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".webp" };
            return {kExts.data(), kExts.size()};
        }

        void recompress(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        int quality) const override;
    };

} // namespace shrink

#endif // SHRINK_WEBP_CODEC_HPP
