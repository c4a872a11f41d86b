#include "kvm_pixel.hpp"

#include <cerrno>
#include <csetjmp>
#include <cstdio>
#include <cstring>

#include <jpeglib.h>

#include <phosphor-logging/log.hpp>

namespace kvm
{

using namespace phosphor::logging;

namespace
{

struct JpegError
{
    jpeg_error_mgr mgr;
    jmp_buf jump;
};

void jpegErrorExit(j_common_ptr cinfo)
{
    JpegError* err = (JpegError*)cinfo->err;
    char message[JMSG_LENGTH_MAX];

    (*cinfo->err->format_message)(cinfo, message);
    log<level::ERR>("JPEG codec error", entry("ERROR=%s", message));

    longjmp(err->jump, 1);
}

// libjpeg warnings on MJPEG streams (missing huffman tables, extraneous
// bytes) are routine
void jpegOutputMessage(j_common_ptr)
{}

inline uint8_t clamp(int v)
{
    return v < 0 ? 0 : (v > 255 ? 255 : static_cast<uint8_t>(v));
}

inline uint8_t scaleChannel(uint32_t pixel, const Bitfield& field)
{
    if (!field.length)
    {
        return 0;
    }

    uint32_t v = (pixel >> field.offset) & ((1u << field.length) - 1);

    if (field.length >= 8)
    {
        return static_cast<uint8_t>(v >> (field.length - 8));
    }

    // stretch so that full scale maps to 255
    return static_cast<uint8_t>(v * 255 / ((1u << field.length) - 1));
}

} // namespace

bool yuyvToRgba(std::span<const uint8_t> yuyv, Geometry geometry,
                std::vector<uint8_t>& rgba)
{
    const size_t pixels = geometry.width * geometry.height;

    if (yuyv.size() < pixels * 2 || geometry.width % 2)
    {
        return false;
    }

    rgba.resize(pixels * Frame::bytesPerPixel);

    uint8_t* out = rgba.data();

    for (size_t i = 0; i < pixels * 2; i += 4)
    {
        const int u = yuyv[i + 1] - 128;
        const int v = yuyv[i + 3] - 128;
        const int ys[2] = {yuyv[i] - 16, yuyv[i + 2] - 16};

        for (int c : ys)
        {
            c *= 298;
            *out++ = clamp((c + 409 * v + 128) >> 8);
            *out++ = clamp((c - 100 * u - 208 * v + 128) >> 8);
            *out++ = clamp((c + 516 * u + 128) >> 8);
            *out++ = 0xff;
        }
    }

    return true;
}

bool decodeJpeg(std::span<const uint8_t> jpeg, Frame& frame)
{
    jpeg_decompress_struct cinfo;
    JpegError err;

    cinfo.err = jpeg_std_error(&err.mgr);
    err.mgr.error_exit = jpegErrorExit;
    err.mgr.output_message = jpegOutputMessage;

    if (setjmp(err.jump))
    {
        jpeg_destroy_decompress(&cinfo);
        return false;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, jpeg.data(), jpeg.size());
    jpeg_read_header(&cinfo, TRUE);

    cinfo.out_color_space = JCS_EXT_RGBA;
    cinfo.dct_method = JDCT_IFAST;

    jpeg_start_decompress(&cinfo);

    frame.width = cinfo.output_width;
    frame.height = cinfo.output_height;
    frame.format = PixelFormat::rgba32;
    frame.data.resize(frame.expectedSize());

    const size_t stride = frame.width * Frame::bytesPerPixel;

    while (cinfo.output_scanline < cinfo.output_height)
    {
        JSAMPROW row = frame.data.data() + cinfo.output_scanline * stride;

        jpeg_read_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);

    return true;
}

bool writeJpeg(const Frame& frame, const std::string& path, int quality)
{
    FILE* file = fopen(path.c_str(), "wb");

    if (!file)
    {
        log<level::ERR>("Failed to open screenshot file",
                        entry("PATH=%s", path.c_str()),
                        entry("ERROR=%s", strerror(errno)));
        return false;
    }

    jpeg_compress_struct cinfo;
    JpegError err;

    cinfo.err = jpeg_std_error(&err.mgr);
    err.mgr.error_exit = jpegErrorExit;

    if (setjmp(err.jump))
    {
        jpeg_destroy_compress(&cinfo);
        fclose(file);
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, file);

    cinfo.image_width = frame.width;
    cinfo.image_height = frame.height;
    cinfo.input_components = Frame::bytesPerPixel;
    cinfo.in_color_space = JCS_EXT_RGBA;

    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    jpeg_start_compress(&cinfo, TRUE);

    const size_t stride = frame.width * Frame::bytesPerPixel;

    while (cinfo.next_scanline < cinfo.image_height)
    {
        JSAMPROW row = const_cast<uint8_t*>(frame.data.data()) +
                       cinfo.next_scanline * stride;

        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    return fclose(file) == 0;
}

void packedToRgba(const uint8_t* src, Geometry geometry,
                  const PackedLayout& layout, std::vector<uint8_t>& rgba)
{
    rgba.resize(geometry.width * geometry.height * Frame::bytesPerPixel);

    uint8_t* out = rgba.data();

    for (size_t y = 0; y < geometry.height; ++y)
    {
        const uint8_t* line = src + y * layout.lineLength;

        for (size_t x = 0; x < geometry.width; ++x)
        {
            uint32_t pixel;

            memcpy(&pixel, line + x * Frame::bytesPerPixel, sizeof(pixel));

            *out++ = scaleChannel(pixel, layout.red);
            *out++ = scaleChannel(pixel, layout.green);
            *out++ = scaleChannel(pixel, layout.blue);
            *out++ = 0xff;
        }
    }
}

} // namespace kvm
