#pragma once

#include "kvm_frame.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kvm
{

/*
 * @struct Bitfield
 * @brief Position of one colour channel inside a packed framebuffer pixel
 */
struct Bitfield
{
    uint32_t offset;
    uint32_t length;
};

/*
 * @struct PackedLayout
 * @brief Layout of a 32 bits per pixel framebuffer line
 */
struct PackedLayout
{
    Bitfield red;
    Bitfield green;
    Bitfield blue;
    /* @brief Bytes from the start of one line to the next */
    size_t lineLength;
};

/*
 * @brief Converts packed YUYV 4:2:2 (BT.601, limited range) to RGBA
 *
 * @param[in] yuyv     - Source pixels, two bytes per pixel
 * @param[in] geometry - Picture size; width must be even
 * @param[out] rgba    - Resized to width * height * 4
 *
 * @return False if the source is shorter than the geometry requires
 */
bool yuyvToRgba(std::span<const uint8_t> yuyv, Geometry geometry,
                std::vector<uint8_t>& rgba);

/*
 * @brief Decodes a JPEG (MJPEG frame) to RGBA
 *
 * @param[in] jpeg   - Compressed picture
 * @param[out] frame - Width, height and data are filled in
 *
 * @return False if libjpeg rejected the data
 */
bool decodeJpeg(std::span<const uint8_t> jpeg, Frame& frame);

/*
 * @brief Compresses an RGBA frame into a JPEG file
 *
 * @param[in] frame   - Picture to write
 * @param[in] path    - Output file path
 * @param[in] quality - libjpeg quality, 1 to 100
 *
 * @return False if the file could not be written
 */
bool writeJpeg(const Frame& frame, const std::string& path, int quality = 85);

/*
 * @brief Extracts RGBA from a 32 bits per pixel framebuffer region
 *
 * @param[in] src      - Mapped framebuffer memory
 * @param[in] geometry - Visible resolution
 * @param[in] layout   - Channel bitfields and line length
 * @param[out] rgba    - Resized to width * height * 4
 */
void packedToRgba(const uint8_t* src, Geometry geometry,
                  const PackedLayout& layout, std::vector<uint8_t>& rgba);

} // namespace kvm
