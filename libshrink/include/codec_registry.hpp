/**
 * @file codec_registry.hpp
 * @brief Owns the available codecs and finds one for a file.
 */

#ifndef SHRINK_CODEC_REGISTRY_HPP
#define SHRINK_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace shrink {

class CodecRegistry {
public:
    /// Registry with the built-in codecs (JPEG, PNG, WebP).
    CodecRegistry();

    /// Registry without any codec, for callers that bring their own.
    static CodecRegistry empty();

    /// Register a codec. Earlier registrations win on lookup.
    void add(std::unique_ptr<ICodec> codec);

    [[nodiscard]] const ICodec* find_by_mime(const std::string& mime) const;

    /// Case-insensitive; @p ext includes the dot.
    [[nodiscard]] const ICodec* find_by_extension(const std::string& ext) const;

    /**
     * @brief Find the codec for a file: by detected MIME type first, by
     * extension second.
     * @return Non-owning pointer, or nullptr if the format is unsupported.
     */
    [[nodiscard]] const ICodec* find_for(const std::filesystem::path& file) const;

    [[nodiscard]] const std::vector<std::unique_ptr<ICodec>>& all() const { return codecs_; }

private:
    struct NoBuiltins {};
    explicit CodecRegistry(NoBuiltins) {}

    std::vector<std::unique_ptr<ICodec>> codecs_;
};

} // namespace shrink

#endif // SHRINK_CODEC_REGISTRY_HPP
