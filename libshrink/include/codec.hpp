/**
 * @file codec.hpp
 * @brief Interface of an image codec able to recompress one format.
 */

#ifndef SHRINK_CODEC_HPP
#define SHRINK_CODEC_HPP

#include <filesystem>
#include <span>
#include <string_view>

/**
 * @namespace shrink
 * @brief Everything in libshrink: naming policy, codecs, the per-file
 * processor, the batch driver, aggregation and report rendering.
 */
namespace shrink {

/**
 * @brief A codec that decodes an image and encodes it again.
 *
 * Implementations are stateless with respect to the files they process,
 * so a single instance owned by CodecRegistry is shared by all worker
 * threads.
 *
 * recompress() reports failures by exception and the exception type
 * carries the classification FileProcessor needs:
 * - DecodeError: the input could not be opened or decoded;
 * - EncodeError: decoding worked, encoding or writing the output did not.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    /// @return Human-readable name (e.g. "JPEG").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return MIME types handled (e.g. "image/jpeg").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return Lower-case extensions handled, with the dot (e.g. ".jpg").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    /**
     * @brief Decode @p input and encode it into @p output.
     * @param input Source image. Never modified.
     * @param output Destination file, created or truncated.
     * @param quality Encoder quality, 1..100. Lossless codecs may ignore it.
     * @throws DecodeError, EncodeError
     */
    virtual void recompress(const std::filesystem::path& input,
                            const std::filesystem::path& output,
                            int quality) const = 0;
};

} // namespace shrink

#endif // SHRINK_CODEC_HPP
