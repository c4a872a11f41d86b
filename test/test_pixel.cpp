#include "kvm_pixel.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include <gtest/gtest.h>

TEST(YuyvToRgba, BlackAndWhite)
{
    // Y0 U Y1 V: black then white, no chroma
    const uint8_t yuyv[] = {16, 128, 235, 128};
    std::vector<uint8_t> rgba;

    ASSERT_TRUE(kvm::yuyvToRgba(yuyv, {2, 1}, rgba));
    ASSERT_EQ(rgba.size(), 8u);
    EXPECT_EQ(rgba[0], 0);
    EXPECT_EQ(rgba[1], 0);
    EXPECT_EQ(rgba[2], 0);
    EXPECT_EQ(rgba[3], 255);
    EXPECT_EQ(rgba[4], 255);
    EXPECT_EQ(rgba[5], 255);
    EXPECT_EQ(rgba[6], 255);
    EXPECT_EQ(rgba[7], 255);
}

TEST(YuyvToRgba, RedDominatesWithHighV)
{
    const uint8_t yuyv[] = {81, 90, 81, 240};
    std::vector<uint8_t> rgba;

    ASSERT_TRUE(kvm::yuyvToRgba(yuyv, {2, 1}, rgba));
    EXPECT_GT(rgba[0], 200);
    EXPECT_LT(rgba[1], 40);
    EXPECT_LT(rgba[2], 40);
}

TEST(YuyvToRgba, RejectsShortInputAndOddWidth)
{
    const uint8_t yuyv[] = {16, 128, 16, 128};
    std::vector<uint8_t> rgba;

    EXPECT_FALSE(kvm::yuyvToRgba(yuyv, {4, 1}, rgba));
    EXPECT_FALSE(kvm::yuyvToRgba(yuyv, {1, 1}, rgba));
}

TEST(PackedToRgba, HonoursBitfieldsAndLineLength)
{
    // BGRX layout, 2x2 with four bytes of padding per line
    const uint8_t fb[] = {3, 2, 1, 0, 6, 5, 4, 0, 0xee, 0xee, 0xee, 0xee,
                          9, 8, 7, 0, 12, 11, 10, 0, 0xee, 0xee, 0xee, 0xee};
    kvm::PackedLayout layout{{16, 8}, {8, 8}, {0, 8}, 12};
    std::vector<uint8_t> rgba;

    kvm::packedToRgba(fb, {2, 2}, layout, rgba);

    EXPECT_EQ(rgba, (std::vector<uint8_t>{1, 2, 3, 255, 4, 5, 6, 255, 7, 8, 9,
                                          255, 10, 11, 12, 255}));
}

TEST(PackedToRgba, ScalesShortChannels)
{
    // RGB565 stored in 32-bit words: full red, no green, full blue
    const uint32_t pixel = (0x1f << 11) | 0x1f;
    uint8_t fb[4];
    kvm::PackedLayout layout{{11, 5}, {5, 6}, {0, 5}, 4};
    std::vector<uint8_t> rgba;

    memcpy(fb, &pixel, sizeof(fb));
    kvm::packedToRgba(fb, {1, 1}, layout, rgba);

    EXPECT_EQ(rgba, (std::vector<uint8_t>{255, 0, 255, 255}));
}

TEST(Jpeg, ScreenshotDecodesToSameSize)
{
    char name[] = "/tmp/kvm-shot-XXXXXX";
    int fd = mkstemp(name);

    ASSERT_GE(fd, 0);
    ::close(fd);

    kvm::Frame frame;

    frame.width = 16;
    frame.height = 8;
    frame.data.resize(frame.expectedSize());
    for (size_t i = 0; i < frame.data.size(); i += 4)
    {
        frame.data[i] = 200;
        frame.data[i + 1] = 100;
        frame.data[i + 2] = 50;
        frame.data[i + 3] = 255;
    }

    ASSERT_TRUE(kvm::writeJpeg(frame, name));

    std::ifstream file(name, std::ios::binary);
    std::vector<uint8_t> jpeg((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    kvm::Frame decoded;

    std::filesystem::remove(name);

    ASSERT_TRUE(kvm::decodeJpeg(jpeg, decoded));
    EXPECT_EQ(decoded.width, 16u);
    EXPECT_EQ(decoded.height, 8u);
    ASSERT_EQ(decoded.data.size(), decoded.expectedSize());
    EXPECT_NEAR(decoded.data[0], 200, 8);
    EXPECT_NEAR(decoded.data[1], 100, 8);
    EXPECT_NEAR(decoded.data[2], 50, 8);
}

TEST(Jpeg, GarbageIsRejected)
{
    const uint8_t garbage[] = {0xff, 0xd8, 0x00, 0x01, 0x02, 0x03};
    kvm::Frame frame;

    EXPECT_FALSE(kvm::decodeJpeg(garbage, frame));
}

TEST(Jpeg, UnwritablePathFails)
{
    kvm::Frame frame;

    frame.width = 1;
    frame.height = 1;
    frame.data.assign(4, 0);

    EXPECT_FALSE(kvm::writeJpeg(frame, "/nonexistent/dir/shot.jpg"));
}
