#include "kvm_video.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <xyz/openbmc_project/Common/Device/error.hpp>
#include <xyz/openbmc_project/Common/File/error.hpp>

#include <filesystem>
#include <fstream>
#include <vector>

#include <gtest/gtest.h>

namespace
{

using sdbusplus::xyz::openbmc_project::Common::File::Error::Open;

/* @brief Regular file standing in for a framebuffer device */
class FramebufferFile
{
  public:
    explicit FramebufferFile(const std::vector<uint8_t>& content)
    {
        char name[] = "/tmp/kvm-fb-XXXXXX";
        int fd = mkstemp(name);

        if (fd >= 0)
        {
            ::close(fd);
        }
        path = name;

        std::ofstream file(path, std::ios::binary);

        file.write(reinterpret_cast<const char*>(content.data()),
                   content.size());
    }

    ~FramebufferFile()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::string path;
};

kvm::SourceOptions options(const std::string& fb)
{
    kvm::SourceOptions opts;

    opts.videoPath = "/nonexistent/video0";
    opts.framebufferPath = fb;
    opts.framebufferHint = {2, 2};

    return opts;
}

} // namespace

TEST(SelectSource, FallsBackToFramebuffer)
{
    // four pixels, bytes in R, G, B, X order
    FramebufferFile fb(
        {10, 20, 30, 0, 40, 50, 60, 0, 70, 80, 90, 0, 1, 2, 3, 0});
    auto source = kvm::selectSource(options(fb.path));

    EXPECT_EQ(source.kind(), kvm::SourceKind::framebuffer);
    EXPECT_EQ(source.geometry(), (kvm::Geometry{2, 2}));
    EXPECT_EQ(source.getPath(), fb.path);

    auto frame = source.nextFrame();

    EXPECT_EQ(frame.width, 2u);
    EXPECT_EQ(frame.height, 2u);
    EXPECT_EQ(frame.format, kvm::PixelFormat::rgba32);
    EXPECT_EQ(frame.data,
              (std::vector<uint8_t>{10, 20, 30, 255, 40, 50, 60, 255, 70, 80,
                                    90, 255, 1, 2, 3, 255}));
}

TEST(SelectSource, ForcedFramebufferSkipsCapture)
{
    FramebufferFile fb(std::vector<uint8_t>(16, 0));
    auto opts = options(fb.path);

    // even a path that exists is not probed when forced
    opts.videoPath = fb.path;
    opts.forceFramebuffer = true;

    auto source = kvm::selectSource(opts);

    EXPECT_EQ(source.kind(), kvm::SourceKind::framebuffer);
}

TEST(SelectSource, ForcedMissingFramebufferThrows)
{
    auto opts = options("/nonexistent/fb0");

    opts.forceFramebuffer = true;

    EXPECT_THROW(kvm::selectSource(opts), Open);
}

TEST(SelectSource, NothingUsableThrows)
{
    EXPECT_THROW(kvm::selectSource(options("/nonexistent/fb0")), Open);
}

TEST(SelectSource, ShortFramebufferFileIsRejected)
{
    FramebufferFile fb(std::vector<uint8_t>(8, 0));

    EXPECT_THROW(kvm::selectSource(options(fb.path)), Open);
}

TEST(CaptureDevice, ProbeOfRegularFileFindsNothing)
{
    FramebufferFile file(std::vector<uint8_t>(16, 0));

    EXPECT_FALSE(kvm::CaptureDevice::probe(file.path));
    EXPECT_FALSE(kvm::CaptureDevice::probe("/nonexistent/video0"));
}

TEST(VideoSource, ClosedFramebufferFailsToRead)
{
    FramebufferFile fb(std::vector<uint8_t>(16, 0));
    auto source = kvm::selectSource(options(fb.path));

    source.close();

    EXPECT_THROW(source.nextFrame(),
                 sdbusplus::xyz::openbmc_project::Common::Device::Error::
                     ReadFailure);
}
