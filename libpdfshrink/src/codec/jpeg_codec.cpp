//
// libjpeg memory source/destination codec.
//

#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/pipeline_errors.hpp"
#include <cstdio>
#include <cstdlib>
#include <jpeglib.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

// corrupt-data warnings are routed to the logger instead of stderr
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

struct DecompressCloser {
    void operator()(jpeg_decompress_struct *c) const { jpeg_destroy_decompress(c); }
};
struct CompressCloser {
    void operator()(jpeg_compress_struct *c) const { jpeg_destroy_compress(c); }
};
struct MallocFree {
    void operator()(unsigned char *p) const { std::free(p); }
};

} // namespace

namespace pdfshrink {

std::optional<JpegImage> decode_jpeg(const std::span<const unsigned char> data) {
    if (data.empty()) {
        return std::nullopt;
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    try {
        jpeg_create_decompress(&cinfo);
        const std::unique_ptr<jpeg_decompress_struct, DecompressCloser> guard(&cinfo);

        jpeg_mem_src(&cinfo, data.data(), static_cast<unsigned long>(data.size()));
        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
            return std::nullopt;
        }

        JpegImage image;
        switch (cinfo.jpeg_color_space) {
            case JCS_GRAYSCALE:
                cinfo.out_color_space = JCS_GRAYSCALE;
                break;
            case JCS_CMYK:
            case JCS_YCCK:
                cinfo.out_color_space = JCS_CMYK;
                image.cmyk = true;
                break;
            default:
                cinfo.out_color_space = JCS_RGB;
                break;
        }

        image.adobe = cinfo.saw_Adobe_marker != FALSE;
        jpeg_start_decompress(&cinfo);

        image.width = static_cast<int>(cinfo.output_width);
        image.height = static_cast<int>(cinfo.output_height);
        image.components = cinfo.output_components;

        const size_t row_stride = static_cast<size_t>(image.width) * image.components;
        image.pixels.resize(row_stride * image.height);
        while (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW row = image.pixels.data() + row_stride * cinfo.output_scanline;
            jpeg_read_scanlines(&cinfo, &row, 1);
        }

        jpeg_finish_decompress(&cinfo);
        return image;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Debug, std::string("JPEG decode failed: ") + e.what(), "libjpeg");
        return std::nullopt;
    }
}

std::vector<unsigned char> encode_jpeg(const std::span<const unsigned char> pixels,
                                       const int width, const int height,
                                       const JpegColor color, const int quality,
                                       const bool adobe_marker) {
    int components = 0;
    J_COLOR_SPACE in_space = JCS_UNKNOWN;
    switch (color) {
        case JpegColor::Gray: components = 1; in_space = JCS_GRAYSCALE; break;
        case JpegColor::Rgb:  components = 3; in_space = JCS_RGB; break;
        case JpegColor::Cmyk: components = 4; in_space = JCS_CMYK; break;
    }

    if (width <= 0 || height <= 0 ||
        pixels.size() != static_cast<size_t>(width) * height * components) {
        throw EncodeError("pixel buffer does not match " + std::to_string(width) + "x" +
                          std::to_string(height) + "x" + std::to_string(components));
    }

    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    unsigned char *out_buffer = nullptr;
    unsigned long out_size = 0;

    try {
        jpeg_create_compress(&cinfo);
        const std::unique_ptr<jpeg_compress_struct, CompressCloser> guard(&cinfo);

        jpeg_mem_dest(&cinfo, &out_buffer, &out_size);

        cinfo.image_width = static_cast<JDIMENSION>(width);
        cinfo.image_height = static_cast<JDIMENSION>(height);
        cinfo.input_components = components;
        cinfo.in_color_space = in_space;
        jpeg_set_defaults(&cinfo);
        // keep CMYK as CMYK; default would be YCCK
        if (color == JpegColor::Cmyk) {
            jpeg_set_colorspace(&cinfo, JCS_CMYK);
            cinfo.write_Adobe_marker = adobe_marker ? TRUE : FALSE;
        }
        jpeg_set_quality(&cinfo, quality, TRUE);
        cinfo.optimize_coding = TRUE;

        jpeg_start_compress(&cinfo, TRUE);
        const size_t row_stride = static_cast<size_t>(width) * components;
        while (cinfo.next_scanline < cinfo.image_height) {
            // libjpeg takes non-const rows; samples are only read
            auto row = const_cast<JSAMPROW>(pixels.data() + row_stride * cinfo.next_scanline);
            jpeg_write_scanlines(&cinfo, &row, 1);
        }
        jpeg_finish_compress(&cinfo);
    } catch (const std::exception& e) {
        std::free(out_buffer);
        throw EncodeError(std::string("libjpeg: ") + e.what());
    }

    const std::unique_ptr<unsigned char, MallocFree> owned(out_buffer);
    if (!out_buffer || out_size == 0) {
        throw EncodeError("libjpeg produced an empty stream");
    }
    return {out_buffer, out_buffer + out_size};
}

} // namespace pdfshrink
