#include "test_helpers.hpp"

#include <algorithm>
#include <cstdio>
#include <jpeglib.h>
#include <png.h>
#include <webp/encode.h>
#include <webp/mux.h>

namespace shrink::test {

namespace {

std::vector<unsigned char> noisy_rgb(int width, int height) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> noise(-40, 40);
    std::vector<unsigned char> pixels(static_cast<std::size_t>(width) * height * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 3;
            const int base[3] = { x * 255 / width, y * 255 / height, 128 };
            for (int c = 0; c < 3; ++c) {
                pixels[i + c] = static_cast<unsigned char>(std::clamp(base[c] + noise(rng), 0, 255));
            }
        }
    }
    return pixels;
}

} // namespace

void write_test_jpeg(const fs::path& file, int width, int height) {
    auto pixels = noisy_rgb(width, height);

    FILE* out = std::fopen(file.string().c_str(), "wb");
    if (!out) throw std::runtime_error("cannot open " + file.string());

    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, out);

    cinfo.image_width = static_cast<JDIMENSION>(width);
    cinfo.image_height = static_cast<JDIMENSION>(height);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 100, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = &pixels[static_cast<std::size_t>(cinfo.next_scanline) * width * 3];
        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    std::fclose(out);
}

void write_test_png(const fs::path& file, int width, int height) {
    const auto pixels = noisy_rgb(width, height);

    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(width);
    image.height = static_cast<png_uint_32>(height);
    image.format = PNG_FORMAT_RGB;

    if (!png_image_write_to_file(&image, file.string().c_str(), 0, pixels.data(), 0, nullptr)) {
        const std::string message = image.message;
        png_image_free(&image);
        throw std::runtime_error("cannot write test PNG: " + message);
    }
}

void write_test_palette_png(const fs::path& file, int width, int height, int colors) {
    std::vector<unsigned char> colormap(static_cast<std::size_t>(colors) * 3);
    for (int i = 0; i < colors; ++i) {
        colormap[i * 3] = static_cast<unsigned char>(i * 255 / std::max(colors - 1, 1));
        colormap[i * 3 + 1] = static_cast<unsigned char>((i * 97) % 256);
        colormap[i * 3 + 2] = static_cast<unsigned char>(255 - i * 255 / std::max(colors - 1, 1));
    }
    std::vector<unsigned char> indices(static_cast<std::size_t>(width) * height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            indices[static_cast<std::size_t>(y) * width + x] = static_cast<unsigned char>(((x + y) / 4) % colors);
        }
    }

    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(width);
    image.height = static_cast<png_uint_32>(height);
    image.format = PNG_FORMAT_RGB_COLORMAP;
    image.colormap_entries = static_cast<png_uint_32>(colors);

    if (!png_image_write_to_file(&image, file.string().c_str(), 0, indices.data(), 0, colormap.data())) {
        const std::string message = image.message;
        png_image_free(&image);
        throw std::runtime_error("cannot write palette PNG: " + message);
    }
}

void write_test_png16(const fs::path& file, int width, int height) {
    const auto rgb8 = noisy_rgb(width, height);
    std::vector<png_uint_16> pixels(rgb8.size());
    std::transform(rgb8.begin(), rgb8.end(), pixels.begin(),
                   [](unsigned char v) { return static_cast<png_uint_16>(v * 257); });

    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(width);
    image.height = static_cast<png_uint_32>(height);
    image.format = PNG_FORMAT_LINEAR_RGB;

    if (!png_image_write_to_file(&image, file.string().c_str(), 0, pixels.data(), 0, nullptr)) {
        const std::string message = image.message;
        png_image_free(&image);
        throw std::runtime_error("cannot write 16-bit PNG: " + message);
    }
}

void write_test_webp(const fs::path& file, int width, int height, const std::string& exif) {
    const auto pixels = noisy_rgb(width, height);

    uint8_t* encoded = nullptr;
    const size_t encoded_size = WebPEncodeRGB(pixels.data(), width, height, width * 3, 100.0f, &encoded);
    if (encoded_size == 0) throw std::runtime_error("WebPEncodeRGB failed");

    std::vector<uint8_t> bytes(encoded, encoded + encoded_size);
    WebPFree(encoded);

    if (!exif.empty()) {
        const WebPData image{bytes.data(), bytes.size()};
        WebPMux* mux = WebPMuxCreate(&image, 1);
        if (!mux) throw std::runtime_error("WebPMuxCreate failed");
        const WebPData chunk{reinterpret_cast<const uint8_t*>(exif.data()), exif.size()};
        WebPData assembled;
        WebPDataInit(&assembled);
        const bool ok = WebPMuxSetChunk(mux, "EXIF", &chunk, 1) == WEBP_MUX_OK &&
                        WebPMuxAssemble(mux, &assembled) == WEBP_MUX_OK;
        WebPMuxDelete(mux);
        if (!ok) {
            WebPDataClear(&assembled);
            throw std::runtime_error("cannot add EXIF to test WebP");
        }
        bytes.assign(assembled.bytes, assembled.bytes + assembled.size);
        WebPDataClear(&assembled);
    }

    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw std::runtime_error("cannot write " + file.string());
}

png_image read_png_header(const fs::path& file) {
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&image, file.string().c_str())) {
        const std::string message = image.message;
        png_image_free(&image);
        throw std::runtime_error("cannot read PNG header: " + message);
    }
    png_image_free(&image);
    return image;
}

} // namespace shrink::test
