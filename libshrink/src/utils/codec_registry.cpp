#include "../../include/codec_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/file_record.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace shrink {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
}

CodecRegistry CodecRegistry::empty() {
    return CodecRegistry(NoBuiltins{});
}

void CodecRegistry::add(std::unique_ptr<ICodec> codec) {
    if (codec) {
        codecs_.push_back(std::move(codec));
    }
}

const ICodec* CodecRegistry::find_by_mime(const std::string& mime) const {
    if (mime.empty()) return nullptr;
    for (const auto& codec : codecs_) {
        const auto mimes = codec->get_supported_mime_types();
        if (std::ranges::find(mimes, mime) != mimes.end()) {
            return codec.get();
        }
    }
    return nullptr;
}

const ICodec* CodecRegistry::find_by_extension(const std::string& ext) const {
    if (ext.empty() || ext[0] != '.') return nullptr;
    const std::string lowered = lower_extension(std::filesystem::path("x" + ext));
    for (const auto& codec : codecs_) {
        const auto exts = codec->get_supported_extensions();
        if (std::ranges::find(exts, lowered) != exts.end()) {
            return codec.get();
        }
    }
    return nullptr;
}

const ICodec* CodecRegistry::find_for(const std::filesystem::path& file) const {
    const auto mime = MimeDetector::detect(file);
    if (const ICodec* codec = find_by_mime(mime)) {
        return codec;
    }
    const ICodec* codec = find_by_extension(file.extension().string());
    if (codec) {
        Logger::log(LogLevel::Debug,
                    "MIME '" + mime + "' not recognised, using " + std::string(codec->get_name()) +
                    " by extension for " + file.string(),
                    "CodecRegistry");
    }
    return codec;
}

} // namespace shrink
