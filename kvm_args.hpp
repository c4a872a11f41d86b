#pragma once

#include <cstdint>
#include <string>

namespace kvm
{
/*
 * @class Args
 * @brief Command line argument parser and storage
 */
class Args
{
  public:
    /* @brief Bounds applied to the requested frame rate */
    static constexpr int minFrameRate = 1;
    static constexpr int maxFrameRate = 60;

    /*
     * @brief Constructs Args object. Throws InvalidArgument for a bad port
     *        or an empty bind address.
     *
     * @param[in] argc - The number of arguments in the command line call
     * @param[in] argv - The array of arguments from the command line
     */
    Args(int argc, char* argv[]);
    ~Args() = default;
    Args(const Args&) = default;
    Args& operator=(const Args&) = default;
    Args(Args&&) = default;
    Args& operator=(Args&&) = default;

    /*
     * @brief Get the desired video frame rate
     *
     * @return Value of the desired frame rate in frames per second
     */
    inline int getFrameRate() const
    {
        return frameRate;
    }

    inline const std::string& getKeyboardPath() const
    {
        return keyboardPath;
    }

    inline const std::string& getPointerPath() const
    {
        return pointerPath;
    }

    /*
     * @brief Get the path to the V4L2 video device
     *
     * @return Reference to the string storing the path to the video device
     */
    inline const std::string& getVideoPath() const
    {
        return videoPath;
    }

    /* @brief Path to the framebuffer used when no capture device works */
    inline const std::string& getFramebufferPath() const
    {
        return framebufferPath;
    }

    /* @brief Whether the capture device is skipped entirely */
    inline bool getForceFramebuffer() const
    {
        return forceFramebuffer;
    }

    inline uint16_t getWebSocketPort() const
    {
        return wsPort;
    }

    inline uint16_t getRfbPort() const
    {
        return rfbPort;
    }

    /* @brief Whether RFB runs over TLS */
    inline bool getTls() const
    {
        return tls;
    }

    inline const std::string& getCertPath() const
    {
        return certPath;
    }

    inline const std::string& getKeyPath() const
    {
        return keyPath;
    }

    /* @brief Address both listeners bind to */
    inline const std::string& getAddress() const
    {
        return address;
    }

  private:
    /* @brief Prints the application usage to stderr */
    void printUsage();

    /* @brief Parses a TCP port, throwing InvalidArgument when out of range */
    static uint16_t parsePort(const char* name, const char* value);

    /*
     * @brief Desired frame rate (in frames per second) of the video
     *        stream
     */
    int frameRate;
    /* @brief Path to the USB keyboard device */
    std::string keyboardPath;
    /* @brief Path to the USB mouse device */
    std::string pointerPath;
    /* @brief Path to the V4L2 video device */
    std::string videoPath;
    std::string framebufferPath;
    bool forceFramebuffer;
    uint16_t wsPort;
    uint16_t rfbPort;
    bool tls;
    /* @brief PEM certificate chain, empty to generate one */
    std::string certPath;
    /* @brief PEM private key, empty to generate one */
    std::string keyPath;
    std::string address;
};

} // namespace kvm
