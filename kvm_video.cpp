#include "kvm_video.hpp"

#include <errno.h>
#include <fcntl.h>
#include <linux/fb.h>
#include <linux/videodev2.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <phosphor-logging/elog-errors.hpp>
#include <phosphor-logging/elog.hpp>
#include <phosphor-logging/log.hpp>
#include <xyz/openbmc_project/Common/Device/error.hpp>
#include <xyz/openbmc_project/Common/File/error.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <span>

namespace kvm
{

using namespace phosphor::logging;
using namespace sdbusplus::xyz::openbmc_project::Common::File::Error;
using namespace sdbusplus::xyz::openbmc_project::Common::Device::Error;

namespace
{

// in order of preference
constexpr std::array<uint32_t, 3> preferredFormats = {
    V4L2_PIX_FMT_MJPEG, V4L2_PIX_FMT_JPEG, V4L2_PIX_FMT_YUYV};

int xioctl(int fd, unsigned long request, void* arg)
{
    int rc;

    do
    {
        rc = ioctl(fd, request, arg);
    } while (rc < 0 && errno == EINTR);

    return rc;
}

std::string fourcc(uint32_t format)
{
    std::string s(4, ' ');

    for (int i = 0; i < 4; ++i)
    {
        s[i] = static_cast<char>((format >> (i * 8)) & 0xff);
    }

    return s;
}

void throwOpen(int err, const std::string& path)
{
    elog<Open>(xyz::openbmc_project::Common::File::Open::ERRNO(err),
               xyz::openbmc_project::Common::File::Open::PATH(path.c_str()));
}

Geometry largestFrameSize(int fd, uint32_t pixelformat, Geometry current)
{
    v4l2_frmsizeenum frmsize{};
    Geometry best{0, 0};

    frmsize.pixel_format = pixelformat;

    for (frmsize.index = 0;
         xioctl(fd, VIDIOC_ENUM_FRAMESIZES, &frmsize) == 0; ++frmsize.index)
    {
        if (frmsize.type == V4L2_FRMSIZE_TYPE_DISCRETE)
        {
            if (frmsize.discrete.width * frmsize.discrete.height >
                best.width * best.height)
            {
                best = {frmsize.discrete.width, frmsize.discrete.height};
            }
        }
        else
        {
            best = {frmsize.stepwise.max_width, frmsize.stepwise.max_height};
            break;
        }
    }

    if (!best.width || !best.height)
    {
        return current;
    }

    return best;
}

} // namespace

std::optional<Capability> CaptureDevice::probe(const std::string& path)
{
    int fd = open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);

    if (fd < 0)
    {
        log<level::INFO>("Capture device not available",
                         entry("PATH=%s", path.c_str()),
                         entry("ERROR=%s", strerror(errno)));
        return std::nullopt;
    }

    v4l2_capability cap{};

    if (xioctl(fd, VIDIOC_QUERYCAP, &cap) < 0)
    {
        log<level::INFO>("Not a V4L2 device", entry("PATH=%s", path.c_str()),
                         entry("ERROR=%s", strerror(errno)));
        ::close(fd);
        return std::nullopt;
    }

    uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS)
                        ? cap.device_caps
                        : cap.capabilities;

    if (!(caps & V4L2_CAP_VIDEO_CAPTURE) || !(caps & V4L2_CAP_STREAMING))
    {
        log<level::INFO>("V4L2 device cannot stream video capture",
                         entry("PATH=%s", path.c_str()));
        ::close(fd);
        return std::nullopt;
    }

    std::vector<uint32_t> offered;
    v4l2_fmtdesc desc{};

    desc.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

    for (desc.index = 0; xioctl(fd, VIDIOC_ENUM_FMT, &desc) == 0; ++desc.index)
    {
        offered.push_back(desc.pixelformat);
    }

    std::optional<Capability> result;

    for (uint32_t want : preferredFormats)
    {
        if (std::find(offered.begin(), offered.end(), want) == offered.end())
        {
            continue;
        }

        v4l2_format fmt{};
        Geometry current{0, 0};

        fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

        if (xioctl(fd, VIDIOC_G_FMT, &fmt) == 0)
        {
            current = {fmt.fmt.pix.width, fmt.fmt.pix.height};
        }

        result = Capability{(const char*)cap.driver,
                            (const char*)cap.card, want,
                            largestFrameSize(fd, want, current)};
        break;
    }

    ::close(fd);

    if (!result)
    {
        log<level::INFO>("V4L2 device offers no MJPEG or YUYV format",
                         entry("PATH=%s", path.c_str()));
        return std::nullopt;
    }

    log<level::INFO>("Found capture device", entry("PATH=%s", path.c_str()),
                     entry("CARD=%s", result->card.c_str()),
                     entry("FORMAT=%s", fourcc(result->pixelformat).c_str()),
                     entry("WIDTH=%zu", result->geometry.width),
                     entry("HEIGHT=%zu", result->geometry.height));

    return result;
}

CaptureDevice::CaptureDevice(const std::string& p, const Capability& cap,
                             int fr) :
    fd(-1),
    pixelformat(cap.pixelformat), size(cap.geometry), path(p)
{
    fd = open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
    {
        int err = errno;

        log<level::ERR>("Failed to open video device",
                        entry("PATH=%s", path.c_str()),
                        entry("ERROR=%s", strerror(err)));
        throwOpen(err, path);
    }

    v4l2_format fmt{};

    fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    fmt.fmt.pix.pixelformat = pixelformat;
    fmt.fmt.pix.width = size.width;
    fmt.fmt.pix.height = size.height;
    fmt.fmt.pix.field = V4L2_FIELD_ANY;

    if (xioctl(fd, VIDIOC_S_FMT, &fmt) < 0)
    {
        int err = errno;

        log<level::ERR>("Failed to set video device format",
                        entry("PATH=%s", path.c_str()),
                        entry("ERROR=%s", strerror(err)));
        close();
        throwOpen(err, path);
    }

    // the driver may have adjusted the request
    pixelformat = fmt.fmt.pix.pixelformat;
    size = {fmt.fmt.pix.width, fmt.fmt.pix.height};

    v4l2_streamparm sparm{};

    sparm.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    sparm.parm.capture.timeperframe.numerator = 1;
    sparm.parm.capture.timeperframe.denominator = fr;

    if (xioctl(fd, VIDIOC_S_PARM, &sparm) < 0)
    {
        log<level::DEBUG>("Video device ignores frame rate",
                          entry("ERROR=%s", strerror(errno)));
    }

    v4l2_requestbuffers req{};

    req.count = bufferCount;
    req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;

    if (xioctl(fd, VIDIOC_REQBUFS, &req) < 0 || !req.count)
    {
        int err = req.count ? errno : ENOMEM;

        log<level::ERR>("Failed to request video buffers",
                        entry("PATH=%s", path.c_str()),
                        entry("ERROR=%s", strerror(err)));
        close();
        throwOpen(err, path);
    }

    for (unsigned int i = 0; i < req.count; ++i)
    {
        v4l2_buffer buf{};

        buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;
        buf.index = i;

        if (xioctl(fd, VIDIOC_QUERYBUF, &buf) < 0)
        {
            int err = errno;

            log<level::ERR>("Failed to query video buffer",
                            entry("ERROR=%s", strerror(err)));
            close();
            throwOpen(err, path);
        }

        void* data = mmap(nullptr, buf.length, PROT_READ | PROT_WRITE,
                          MAP_SHARED, fd, buf.m.offset);

        if (data == MAP_FAILED)
        {
            int err = errno;

            log<level::ERR>("Failed to map video buffer",
                            entry("ERROR=%s", strerror(err)));
            close();
            throwOpen(err, path);
        }

        buffers.push_back({data, buf.length});

        if (xioctl(fd, VIDIOC_QBUF, &buf) < 0)
        {
            int err = errno;

            log<level::ERR>("Failed to queue video buffer",
                            entry("ERROR=%s", strerror(err)));
            close();
            throwOpen(err, path);
        }
    }

    v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

    if (xioctl(fd, VIDIOC_STREAMON, &type) < 0)
    {
        int err = errno;

        log<level::ERR>("Failed to start video streaming",
                        entry("ERROR=%s", strerror(err)));
        close();
        throwOpen(err, path);
    }

    log<level::INFO>("Capture device streaming", entry("PATH=%s", path.c_str()),
                     entry("FORMAT=%s", fourcc(pixelformat).c_str()),
                     entry("WIDTH=%zu", size.width),
                     entry("HEIGHT=%zu", size.height));
}

CaptureDevice::CaptureDevice(CaptureDevice&& other) noexcept :
    fd(other.fd), pixelformat(other.pixelformat), size(other.size),
    buffers(std::move(other.buffers)), path(std::move(other.path))
{
    other.fd = -1;
    other.buffers.clear();
}

CaptureDevice::~CaptureDevice()
{
    close();
}

void CaptureDevice::close()
{
    if (fd >= 0)
    {
        v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

        xioctl(fd, VIDIOC_STREAMOFF, &type);
    }

    for (auto& buffer : buffers)
    {
        munmap(buffer.data, buffer.length);
    }

    buffers.clear();

    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

Frame CaptureDevice::nextFrame()
{
    int err = 0;

    for (int attempt = 0; attempt < maxRetries; ++attempt)
    {
        pollfd pfd{fd, POLLIN, 0};
        int rc = poll(&pfd, 1, pollTimeoutMs);

        if (rc < 0)
        {
            err = errno;
            if (err == EINTR)
            {
                continue;
            }
            break;
        }

        if (rc == 0)
        {
            err = ETIMEDOUT;
            log<level::DEBUG>("Timed out waiting for video frame",
                              entry("PATH=%s", path.c_str()));
            continue;
        }

        v4l2_buffer buf{};

        buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
        buf.memory = V4L2_MEMORY_MMAP;

        if (xioctl(fd, VIDIOC_DQBUF, &buf) < 0)
        {
            err = errno;
            if (err == EAGAIN || err == EIO)
            {
                continue;
            }
            break;
        }

        Frame frame;
        bool decoded = !(buf.flags & V4L2_BUF_FLAG_ERROR) &&
                       buf.index < buffers.size() &&
                       decode(buffers[buf.index], buf.bytesused, frame);

        if (xioctl(fd, VIDIOC_QBUF, &buf) < 0)
        {
            err = errno;
            log<level::ERR>("Failed to requeue video buffer",
                            entry("ERROR=%s", strerror(err)));
            break;
        }

        if (decoded)
        {
            return frame;
        }

        err = EIO;
        log<level::DEBUG>("Dropped undecodable video buffer",
                          entry("PATH=%s", path.c_str()));
    }

    log<level::ERR>("Failed to capture video frame",
                    entry("PATH=%s", path.c_str()),
                    entry("ERROR=%s", strerror(err)));
    report<ReadFailure>(
        xyz::openbmc_project::Common::Device::ReadFailure::CALLOUT_ERRNO(err),
        xyz::openbmc_project::Common::Device::ReadFailure::CALLOUT_DEVICE_PATH(
            path.c_str()));
    throw ReadFailure();
}

bool CaptureDevice::decode(const Buffer& buffer, size_t bytesUsed,
                           Frame& frame) const
{
    std::span<const uint8_t> data(static_cast<const uint8_t*>(buffer.data),
                                  std::min(bytesUsed, buffer.length));

    switch (pixelformat)
    {
        case V4L2_PIX_FMT_MJPEG:
        case V4L2_PIX_FMT_JPEG:
            return decodeJpeg(data, frame);

        case V4L2_PIX_FMT_YUYV:
            frame.width = size.width;
            frame.height = size.height;
            frame.format = PixelFormat::rgba32;
            return yuyvToRgba(data, size, frame.data);

        default:
            return false;
    }
}

FramebufferDevice::FramebufferDevice(const std::string& p, Geometry hint) :
    fd(-1), map(nullptr), mapLength(0), visibleOffset(0), size(hint),
    layout{{0, 8}, {8, 8}, {16, 8}, hint.width * Frame::bytesPerPixel},
    path(p)
{
    fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        int err = errno;

        log<level::ERR>("Failed to open framebuffer device",
                        entry("PATH=%s", path.c_str()),
                        entry("ERROR=%s", strerror(err)));
        throwOpen(err, path);
    }

    fb_var_screeninfo var{};
    fb_fix_screeninfo fix{};

    if (xioctl(fd, FBIOGET_VSCREENINFO, &var) == 0 &&
        xioctl(fd, FBIOGET_FSCREENINFO, &fix) == 0)
    {
        if (var.bits_per_pixel != 32)
        {
            log<level::ERR>("Unsupported framebuffer depth",
                            entry("PATH=%s", path.c_str()),
                            entry("BPP=%u", var.bits_per_pixel));
            close();
            throwOpen(EINVAL, path);
        }

        size = {var.xres, var.yres};
        layout = {{var.red.offset, var.red.length},
                  {var.green.offset, var.green.length},
                  {var.blue.offset, var.blue.length},
                  fix.line_length};
        visibleOffset = var.yoffset * fix.line_length +
                        var.xoffset * Frame::bytesPerPixel;
        mapLength = fix.smem_len;
    }
    else
    {
        // not a framebuffer driver: a raw RGBA dump of the hinted size
        struct stat st;

        mapLength = layout.lineLength * size.height;

        if (fstat(fd, &st) < 0 || !S_ISREG(st.st_mode) ||
            static_cast<size_t>(st.st_size) < mapLength)
        {
            log<level::ERR>("Framebuffer file does not hold a full frame",
                            entry("PATH=%s", path.c_str()),
                            entry("WIDTH=%zu", size.width),
                            entry("HEIGHT=%zu", size.height));
            close();
            throwOpen(EINVAL, path);
        }
    }

    if (!size.width || !size.height ||
        visibleOffset + layout.lineLength * size.height > mapLength)
    {
        log<level::ERR>("Framebuffer geometry exceeds its memory",
                        entry("PATH=%s", path.c_str()));
        close();
        throwOpen(EINVAL, path);
    }

    void* data = mmap(nullptr, mapLength, PROT_READ, MAP_SHARED, fd, 0);

    if (data == MAP_FAILED)
    {
        int err = errno;

        log<level::ERR>("Failed to map framebuffer",
                        entry("PATH=%s", path.c_str()),
                        entry("ERROR=%s", strerror(err)));
        close();
        throwOpen(err, path);
    }

    map = static_cast<uint8_t*>(data);

    log<level::INFO>("Framebuffer mapped", entry("PATH=%s", path.c_str()),
                     entry("WIDTH=%zu", size.width),
                     entry("HEIGHT=%zu", size.height));
}

FramebufferDevice::FramebufferDevice(FramebufferDevice&& other) noexcept :
    fd(other.fd), map(other.map), mapLength(other.mapLength),
    visibleOffset(other.visibleOffset), size(other.size),
    layout(other.layout), path(std::move(other.path))
{
    other.fd = -1;
    other.map = nullptr;
    other.mapLength = 0;
}

FramebufferDevice::~FramebufferDevice()
{
    close();
}

void FramebufferDevice::close()
{
    if (map)
    {
        munmap(map, mapLength);
        map = nullptr;
    }

    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

Frame FramebufferDevice::nextFrame()
{
    if (!map)
    {
        log<level::ERR>("Framebuffer read after close",
                        entry("PATH=%s", path.c_str()));
        elog<ReadFailure>(
            xyz::openbmc_project::Common::Device::ReadFailure::CALLOUT_ERRNO(
                EBADF),
            xyz::openbmc_project::Common::Device::ReadFailure::
                CALLOUT_DEVICE_PATH(path.c_str()));
    }

    Frame frame;

    frame.width = size.width;
    frame.height = size.height;
    frame.format = PixelFormat::rgba32;
    packedToRgba(map + visibleOffset, size, layout, frame.data);

    return frame;
}

VideoSource::VideoSource(CaptureDevice&& dev) : device(std::move(dev))
{}

VideoSource::VideoSource(FramebufferDevice&& dev) : device(std::move(dev))
{}

SourceKind VideoSource::kind() const
{
    return std::holds_alternative<CaptureDevice>(device)
               ? SourceKind::captureDevice
               : SourceKind::framebuffer;
}

Geometry VideoSource::geometry() const
{
    return std::visit([](const auto& dev) { return dev.geometry(); }, device);
}

const std::string& VideoSource::getPath() const
{
    return std::visit(
        [](const auto& dev) -> const std::string& { return dev.getPath(); },
        device);
}

Frame VideoSource::nextFrame()
{
    return std::visit([](auto& dev) { return dev.nextFrame(); }, device);
}

void VideoSource::close()
{
    std::visit([](auto& dev) { dev.close(); }, device);
}

VideoSource selectSource(const SourceOptions& options)
{
    if (options.forceFramebuffer)
    {
        log<level::INFO>("Framebuffer forced",
                         entry("PATH=%s", options.framebufferPath.c_str()));
        return VideoSource(FramebufferDevice(options.framebufferPath,
                                             options.framebufferHint));
    }

    auto cap = CaptureDevice::probe(options.videoPath);

    if (cap)
    {
        try
        {
            return VideoSource(
                CaptureDevice(options.videoPath, *cap, options.frameRate));
        }
        catch (const Open& e)
        {
            log<level::ERR>("Capture device unusable, trying framebuffer",
                            entry("PATH=%s", options.videoPath.c_str()),
                            entry("ERROR=%s", e.what()));
        }
    }

    try
    {
        return VideoSource(FramebufferDevice(options.framebufferPath,
                                             options.framebufferHint));
    }
    catch (const Open&)
    {
        log<level::ERR>("No usable video source",
                        entry("VIDEO=%s", options.videoPath.c_str()),
                        entry("FRAMEBUFFER=%s",
                              options.framebufferPath.c_str()));
        throw;
    }
}

} // namespace kvm
