#include "../../include/webp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <webp/mux.h>
#include <array>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct WebPBufferFree {
    void operator()(uint8_t* p) const { if (p) WebPFree(p); }
};
using unique_webp_buffer = std::unique_ptr<uint8_t, WebPBufferFree>;

struct WebPMuxDeleter {
    void operator()(WebPMux* m) const { if (m) WebPMuxDelete(m); }
};
using unique_mux = std::unique_ptr<WebPMux, WebPMuxDeleter>;

std::vector<uint8_t> read_all(const std::filesystem::path& input) {
    std::ifstream file(input, std::ios::binary | std::ios::ate);
    if (!file) {
        throw shrink::DecodeError("cannot open WebP input");
    }
    const std::streamsize size = file.tellg();
    if (size <= 0) {
        throw shrink::DecodeError("empty WebP input");
    }
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw shrink::DecodeError("failed to read WebP input");
    }
    return data;
}

/**
 * @brief Puts the EXIF/XMP/ICC chunks of the source onto the new bitstream.
 * @return The assembled file, or the bare bitstream if the source has no
 *         metadata chunks.
 */
std::vector<uint8_t> attach_metadata(const std::vector<uint8_t>& source,
                                     const uint8_t* encoded, const size_t encoded_size) {
    const WebPData source_data{source.data(), source.size()};
    const unique_mux mux_in(WebPMuxCreate(&source_data, 0));
    if (!mux_in) {
        return {encoded, encoded + encoded_size};
    }

    constexpr std::array<const char*, 3> kChunks = {"EXIF", "XMP ", "ICCP"};
    bool any = false;
    for (const auto* fourcc : kChunks) {
        WebPData chunk;
        if (WebPMuxGetChunk(mux_in.get(), fourcc, &chunk) == WEBP_MUX_OK) any = true;
    }
    if (!any) {
        return {encoded, encoded + encoded_size};
    }

    const WebPData encoded_data{encoded, encoded_size};
    const unique_mux mux_out(WebPMuxCreate(&encoded_data, 1));
    if (!mux_out) {
        throw shrink::EncodeError("WebPMuxCreate failed");
    }
    for (const auto* fourcc : kChunks) {
        WebPData chunk;
        if (WebPMuxGetChunk(mux_in.get(), fourcc, &chunk) == WEBP_MUX_OK &&
            WebPMuxSetChunk(mux_out.get(), fourcc, &chunk, 1) != WEBP_MUX_OK) {
            throw shrink::EncodeError(std::string("cannot copy WebP chunk ") + fourcc);
        }
    }

    WebPData assembled;
    WebPDataInit(&assembled);
    if (WebPMuxAssemble(mux_out.get(), &assembled) != WEBP_MUX_OK) {
        WebPDataClear(&assembled);
        throw shrink::EncodeError("WebPMuxAssemble failed");
    }
    std::vector<uint8_t> result(assembled.bytes, assembled.bytes + assembled.size);
    WebPDataClear(&assembled);
    return result;
}

} // namespace

namespace shrink {

void WebpCodec::recompress(const std::filesystem::path& input,
                           const std::filesystem::path& output,
                           const int quality) const {
    Logger::log(LogLevel::Debug, "Start WebP recompression: " + input.string(), "webp_codec");

    const std::vector<uint8_t> input_data = read_all(input);

    WebPBitstreamFeatures features;
    if (WebPGetFeatures(input_data.data(), input_data.size(), &features) != VP8_STATUS_OK) {
        throw DecodeError("WebP feature detection failed");
    }
    if (features.has_animation) {
        throw DecodeError("animated WebP is not supported");
    }

    int width = 0, height = 0;
    const unique_webp_buffer rgba(WebPDecodeRGBA(input_data.data(), input_data.size(), &width, &height));
    if (!rgba) {
        throw DecodeError("WebP decode failed");
    }

    uint8_t* encoded_raw = nullptr;
    const size_t encoded_size = WebPEncodeRGBA(rgba.get(), width, height, width * 4,
                                               static_cast<float>(quality), &encoded_raw);
    const unique_webp_buffer encoded(encoded_raw);
    if (encoded_size == 0 || !encoded) {
        throw EncodeError("WebP encode failed");
    }

    const std::vector<uint8_t> final_data = attach_metadata(input_data, encoded.get(), encoded_size);

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw EncodeError("cannot open WebP output");
    }
    out.write(reinterpret_cast<const char*>(final_data.data()), static_cast<std::streamsize>(final_data.size()));
    out.flush();
    if (!out) {
        throw EncodeError("write failed for WebP output");
    }

    Logger::log(LogLevel::Debug, "WebP recompression completed: " + output.string(), "webp_codec");
}

} // namespace shrink
