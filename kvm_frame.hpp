#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kvm
{

/* @brief Pixel layout tag of a frame. Only RGBA is produced. */
enum class PixelFormat
{
    rgba32
};

/*
 * @struct Geometry
 * @brief Width and height of a video surface in pixels
 */
struct Geometry
{
    size_t width;
    size_t height;

    bool operator==(const Geometry&) const = default;
};

/*
 * @struct Frame
 * @brief One captured picture, normalized to 32-bit RGBA
 */
struct Frame
{
    static constexpr size_t bytesPerPixel = 4;

    size_t width = 0;
    size_t height = 0;
    PixelFormat format = PixelFormat::rgba32;
    /* @brief Assigned by the FrameHub at publication, starting at 1 */
    uint64_t sequence = 0;
    std::vector<uint8_t> data;

    inline Geometry geometry() const
    {
        return {width, height};
    }

    inline size_t expectedSize() const
    {
        return width * height * bytesPerPixel;
    }
};

} // namespace kvm
