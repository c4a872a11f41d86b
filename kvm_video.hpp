#pragma once

#include "kvm_frame.hpp"
#include "kvm_pixel.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kvm
{

/* @brief Backend kinds a VideoSource can wrap */
enum class SourceKind
{
    captureDevice,
    framebuffer
};

/*
 * @struct Capability
 * @brief What a V4L2 capture device offers and what will be negotiated
 */
struct Capability
{
    /* @brief Driver name reported by VIDIOC_QUERYCAP */
    std::string driver;
    /* @brief Card name reported by VIDIOC_QUERYCAP */
    std::string card;
    /* @brief Preferred pixel format, MJPEG/JPEG before YUYV */
    uint32_t pixelformat;
    /* @brief Largest resolution offered for that pixel format */
    Geometry geometry;
};

/*
 * @class CaptureDevice
 * @brief V4L2 streaming capture device decoded to RGBA
 */
class CaptureDevice
{
  public:
    /* @brief Number of failed dequeue attempts tolerated per frame */
    static constexpr int maxRetries = 5;
    /* @brief Time to wait for the device per attempt */
    static constexpr int pollTimeoutMs = 1000;
    /* @brief Number of buffers requested from the driver */
    static constexpr unsigned int bufferCount = 3;

    /*
     * @brief Checks whether the path is a usable capture device
     *
     * @param[in] path - Path to the V4L2 video device
     *
     * @return Capability of the device, or nothing if it cannot be used
     */
    static std::optional<Capability> probe(const std::string& path);

    /*
     * @brief Opens the device and starts streaming
     *
     * @param[in] path - Path to the V4L2 video device
     * @param[in] cap  - Result of a successful probe of that path
     * @param[in] fr   - Desired frame rate
     */
    CaptureDevice(const std::string& path, const Capability& cap, int fr);
    ~CaptureDevice();
    CaptureDevice(const CaptureDevice&) = delete;
    CaptureDevice& operator=(const CaptureDevice&) = delete;
    CaptureDevice(CaptureDevice&& other) noexcept;
    CaptureDevice& operator=(CaptureDevice&&) = delete;

    /*
     * @brief Dequeues and decodes the next captured buffer
     *
     * @return RGBA frame
     */
    Frame nextFrame();

    /* @brief Stops streaming, unmaps the buffers and closes the device */
    void close();

    inline Geometry geometry() const
    {
        return size;
    }

    inline const std::string& getPath() const
    {
        return path;
    }

  private:
    struct Buffer
    {
        void* data;
        size_t length;
    };

    /*
     * @brief Converts one dequeued buffer to RGBA
     *
     * @return False if the buffer could not be decoded
     */
    bool decode(const Buffer& buffer, size_t bytesUsed, Frame& frame) const;

    /* @brief File descriptor of the video device */
    int fd;
    /* @brief Negotiated V4L2 pixel format */
    uint32_t pixelformat;
    /* @brief Negotiated resolution */
    Geometry size;
    /* @brief Driver buffers mapped into the process */
    std::vector<Buffer> buffers;
    /* @brief Path to the V4L2 video device */
    std::string path;
};

/*
 * @class FramebufferDevice
 * @brief Memory mapped framebuffer, copied out on every read
 */
class FramebufferDevice
{
  public:
    /*
     * @brief Maps the framebuffer
     *
     * @param[in] path - Path to the framebuffer device
     * @param[in] hint - Geometry to assume when the device does not report
     *                   one (plain files)
     */
    FramebufferDevice(const std::string& path, Geometry hint);
    ~FramebufferDevice();
    FramebufferDevice(const FramebufferDevice&) = delete;
    FramebufferDevice& operator=(const FramebufferDevice&) = delete;
    FramebufferDevice(FramebufferDevice&& other) noexcept;
    FramebufferDevice& operator=(FramebufferDevice&&) = delete;

    /* @brief Copies the visible region out as RGBA */
    Frame nextFrame();

    /* @brief Unmaps and closes the device */
    void close();

    inline Geometry geometry() const
    {
        return size;
    }

    inline const std::string& getPath() const
    {
        return path;
    }

  private:
    int fd;
    uint8_t* map;
    size_t mapLength;
    /* @brief Offset of the visible region inside the mapping */
    size_t visibleOffset;
    Geometry size;
    PackedLayout layout;
    std::string path;
};

/*
 * @class VideoSource
 * @brief One of the two backends behind a single capture interface
 */
class VideoSource
{
  public:
    explicit VideoSource(CaptureDevice&& device);
    explicit VideoSource(FramebufferDevice&& device);
    ~VideoSource() = default;
    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;
    VideoSource(VideoSource&&) = default;
    VideoSource& operator=(VideoSource&&) = delete;

    SourceKind kind() const;
    Geometry geometry() const;
    const std::string& getPath() const;

    /* @brief Captures one frame; throws ReadFailure when the device is gone */
    Frame nextFrame();

    void close();

  private:
    std::variant<CaptureDevice, FramebufferDevice> device;
};

/*
 * @struct SourceOptions
 * @brief Inputs of the startup source selection
 */
struct SourceOptions
{
    std::string videoPath;
    std::string framebufferPath;
    bool forceFramebuffer = false;
    int frameRate = 30;
    Geometry framebufferHint = {1920, 1080};
};

/*
 * @brief Picks the video backend: the framebuffer when forced, otherwise the
 *        capture device with the framebuffer as fallback
 *
 * @param[in] options - Device paths and preferences
 *
 * @return The opened source; throws Open when nothing can be opened
 */
VideoSource selectSource(const SourceOptions& options);

} // namespace kvm
