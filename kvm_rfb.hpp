#pragma once

#include "kvm_frame.hpp"
#include "kvm_input.hpp"

#include <rfb/rfbproto.h>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kvm
{

/*
 * @class RfbSession
 * @brief RFB 3.x server side protocol state machine of one connection. Bytes
 *        received from the client go in, bytes to send come out; the
 *        transport is someone else's business.
 */
class RfbSession
{
  public:
    enum class State
    {
        awaitVersion,
        awaitSecurityChoice,
        awaitClientInit,
        running,
        closed
    };

    /* @brief Longest cut text accepted before the client is dropped */
    static constexpr uint32_t maxCutText = 1 << 20;

    /*
     * @brief Constructs RfbSession object
     *
     * @param[in] g    - Framebuffer geometry announced in ServerInit
     * @param[in] sink - Receives the HID reports of this client
     * @param[in] name - Desktop name announced in ServerInit
     */
    RfbSession(Geometry g, InputSink& sink, const std::string& name);
    ~RfbSession() = default;
    RfbSession(const RfbSession&) = delete;
    RfbSession& operator=(const RfbSession&) = delete;
    RfbSession(RfbSession&&) = delete;
    RfbSession& operator=(RfbSession&&) = delete;

    /* @brief The server's ProtocolVersion message, sent first */
    static std::vector<uint8_t> greeting();

    /*
     * @brief Processes every complete client message at the front of the
     *        input. Any malformed message closes the session.
     *
     * @param[in] in   - Bytes received and not consumed yet
     * @param[out] out - Replies are appended here
     *
     * @return Number of bytes consumed from the front of the input
     */
    size_t consume(std::span<const uint8_t> in, std::vector<uint8_t>& out);

    /*
     * @brief Builds the FramebufferUpdate header for a frame: one raw
     *        rectangle covering the whole frame, preceded by a DesktopSize
     *        rectangle when the geometry changed. The raw pixel data of the
     *        frame follows the header on the wire.
     *
     * @param[in] frame - Frame to be sent
     *
     * @return The header, or an empty vector if the client cannot follow a
     *         geometry change; the session is closed in that case
     */
    std::vector<uint8_t> frameUpdateHeader(const Frame& frame);

    inline State state() const
    {
        return st;
    }

    /* @brief Whether a FramebufferUpdateRequest is outstanding */
    inline bool updateRequested() const
    {
        return pendingUpdate;
    }

    inline Geometry announcedGeometry() const
    {
        return geometry;
    }

    /* @brief Pixel format the client asked for; never used for sending */
    inline const rfbPixelFormat& requestedFormat() const
    {
        return clientFormat;
    }

    /* @brief Negotiated protocol minor version: 3, 7 or 8 */
    inline int minorVersion() const
    {
        return minor;
    }

    inline void close()
    {
        st = State::closed;
    }

  private:
    size_t handleVersion(std::span<const uint8_t> in,
                         std::vector<uint8_t>& out);
    size_t handleSecurityChoice(std::span<const uint8_t> in,
                                std::vector<uint8_t>& out);
    size_t handleClientInit(std::span<const uint8_t> in,
                            std::vector<uint8_t>& out);
    size_t handleMessage(std::span<const uint8_t> in);
    size_t handleSetEncodings(std::span<const uint8_t> in);

    /* @brief Pixel format every update is sent in */
    static rfbPixelFormat serverFormat();

    State st;
    int minor;
    Geometry geometry;
    InputSink& sink;
    Translator translator;
    std::string desktopName;
    rfbPixelFormat clientFormat;
    bool pendingUpdate;
    bool desktopSizeOffered;
};

} // namespace kvm
