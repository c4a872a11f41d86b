#include "kvm_rfb.hpp"

#include <phosphor-logging/log.hpp>

#include <cstdio>
#include <cstring>

namespace kvm
{

using namespace phosphor::logging;

namespace
{

constexpr int serverMajor = 3;
constexpr int serverMinor = 8;

template <typename T>
void append(std::vector<uint8_t>& out, const T& msg, size_t size)
{
    const uint8_t* p = (const uint8_t*)&msg;

    out.insert(out.end(), p, p + size);
}

void appendCard32(std::vector<uint8_t>& out, uint32_t value)
{
    uint32_t wire = Swap32IfLE(value);

    append(out, wire, sizeof(wire));
}

template <typename T>
T readMsg(std::span<const uint8_t> in, size_t size)
{
    T msg;

    memcpy(&msg, in.data(), size);

    return msg;
}

} // namespace

RfbSession::RfbSession(Geometry g, InputSink& sink, const std::string& name) :
    st(State::awaitVersion), minor(serverMinor), geometry(g), sink(sink),
    desktopName(name), clientFormat(serverFormat()), pendingUpdate(false),
    desktopSizeOffered(false)
{}

std::vector<uint8_t> RfbSession::greeting()
{
    char version[sz_rfbProtocolVersionMsg + 1];

    snprintf(version, sizeof(version), rfbProtocolVersionFormat, serverMajor,
             serverMinor);

    return std::vector<uint8_t>(version, version + sz_rfbProtocolVersionMsg);
}

size_t RfbSession::consume(std::span<const uint8_t> in,
                           std::vector<uint8_t>& out)
{
    size_t consumed = 0;

    while (st != State::closed && consumed < in.size())
    {
        std::span<const uint8_t> rest = in.subspan(consumed);
        size_t used = 0;

        switch (st)
        {
            case State::awaitVersion:
                used = handleVersion(rest, out);
                break;
            case State::awaitSecurityChoice:
                used = handleSecurityChoice(rest, out);
                break;
            case State::awaitClientInit:
                used = handleClientInit(rest, out);
                break;
            case State::running:
                used = handleMessage(rest);
                break;
            case State::closed:
                break;
        }

        if (!used)
        {
            // incomplete message, wait for more bytes
            break;
        }

        consumed += used;
    }

    return consumed;
}

size_t RfbSession::handleVersion(std::span<const uint8_t> in,
                                 std::vector<uint8_t>& out)
{
    if (in.size() < sz_rfbProtocolVersionMsg)
    {
        return 0;
    }

    char version[sz_rfbProtocolVersionMsg + 1] = {0};
    int major = 0;
    int clientMinor = 0;

    memcpy(version, in.data(), sz_rfbProtocolVersionMsg);

    if (strncmp(version, "RFB ", 4) ||
        version[sz_rfbProtocolVersionMsg - 1] != '\n' ||
        sscanf(version, rfbProtocolVersionFormat, &major, &clientMinor) != 2)
    {
        log<level::ERR>("Malformed RFB protocol version");
        close();
        return sz_rfbProtocolVersionMsg;
    }

    if (major != serverMajor)
    {
        log<level::ERR>("Unsupported RFB major version",
                        entry("MAJOR=%d", major));
        close();
        return sz_rfbProtocolVersionMsg;
    }

    // 3.5 is 3.3 in disguise, 3.889 is Apple's 3.8
    if (clientMinor >= 8)
    {
        minor = 8;
    }
    else if (clientMinor == 7)
    {
        minor = 7;
    }
    else
    {
        minor = 3;
    }

    log<level::DEBUG>("RFB version agreed", entry("MINOR=%d", minor));

    if (minor == 3)
    {
        // the server picks the security type
        appendCard32(out, rfbSecTypeNone);
        st = State::awaitClientInit;
    }
    else
    {
        out.push_back(1);
        out.push_back(rfbSecTypeNone);
        st = State::awaitSecurityChoice;
    }

    return sz_rfbProtocolVersionMsg;
}

size_t RfbSession::handleSecurityChoice(std::span<const uint8_t> in,
                                        std::vector<uint8_t>& out)
{
    if (in[0] != rfbSecTypeNone)
    {
        log<level::ERR>("Client chose unsupported security type",
                        entry("TYPE=%u", in[0]));
        close();
        return 1;
    }

    if (minor >= 8)
    {
        appendCard32(out, rfbVncAuthOK);
    }

    st = State::awaitClientInit;

    return 1;
}

size_t RfbSession::handleClientInit(std::span<const uint8_t> in,
                                    std::vector<uint8_t>& out)
{
    // shared flag: every client sees the same screen anyway
    log<level::DEBUG>("RFB client init", entry("SHARED=%u", in[0]));

    rfbServerInitMsg si;

    si.framebufferWidth = Swap16IfLE(static_cast<uint16_t>(geometry.width));
    si.framebufferHeight = Swap16IfLE(static_cast<uint16_t>(geometry.height));
    si.format = serverFormat();
    si.format.redMax = Swap16IfLE(si.format.redMax);
    si.format.greenMax = Swap16IfLE(si.format.greenMax);
    si.format.blueMax = Swap16IfLE(si.format.blueMax);
    si.nameLength = Swap32IfLE(static_cast<uint32_t>(desktopName.size()));

    append(out, si, sz_rfbServerInitMsg);
    out.insert(out.end(), desktopName.begin(), desktopName.end());

    st = State::running;

    return 1;
}

size_t RfbSession::handleMessage(std::span<const uint8_t> in)
{
    switch (in[0])
    {
        case rfbSetPixelFormat:
        {
            if (in.size() < sz_rfbSetPixelFormatMsg)
            {
                return 0;
            }

            auto msg =
                readMsg<rfbSetPixelFormatMsg>(in, sz_rfbSetPixelFormatMsg);

            clientFormat = msg.format;
            clientFormat.redMax = Swap16IfLE(clientFormat.redMax);
            clientFormat.greenMax = Swap16IfLE(clientFormat.greenMax);
            clientFormat.blueMax = Swap16IfLE(clientFormat.blueMax);

            log<level::DEBUG>("RFB client pixel format ignored",
                              entry("BPP=%u", clientFormat.bitsPerPixel));

            return sz_rfbSetPixelFormatMsg;
        }

        case rfbSetEncodings:
            return handleSetEncodings(in);

        case rfbFramebufferUpdateRequest:
        {
            if (in.size() < sz_rfbFramebufferUpdateRequestMsg)
            {
                return 0;
            }

            // always answered with the full frame, incremental or not
            pendingUpdate = true;

            return sz_rfbFramebufferUpdateRequestMsg;
        }

        case rfbKeyEvent:
        {
            if (in.size() < sz_rfbKeyEventMsg)
            {
                return 0;
            }

            auto msg = readMsg<rfbKeyEventMsg>(in, sz_rfbKeyEventMsg);

            translator.apply(KeyEvent{Swap32IfLE(msg.key), msg.down != 0},
                             sink);

            return sz_rfbKeyEventMsg;
        }

        case rfbPointerEvent:
        {
            if (in.size() < sz_rfbPointerEventMsg)
            {
                return 0;
            }

            auto msg = readMsg<rfbPointerEventMsg>(in, sz_rfbPointerEventMsg);

            translator.apply(PointerEvent{Swap16IfLE(msg.x), Swap16IfLE(msg.y),
                                          msg.buttonMask},
                             sink);

            return sz_rfbPointerEventMsg;
        }

        case rfbClientCutText:
        {
            if (in.size() < sz_rfbClientCutTextMsg)
            {
                return 0;
            }

            auto msg = readMsg<rfbClientCutTextMsg>(in, sz_rfbClientCutTextMsg);
            uint32_t length = Swap32IfLE(msg.length);

            if (length > maxCutText)
            {
                log<level::ERR>("RFB cut text too long",
                                entry("LENGTH=%u", length));
                close();
                return sz_rfbClientCutTextMsg;
            }

            if (in.size() < sz_rfbClientCutTextMsg + length)
            {
                return 0;
            }

            return sz_rfbClientCutTextMsg + length;
        }

        default:
            log<level::ERR>("Unknown RFB client message",
                            entry("TYPE=%u", in[0]));
            close();
            return 1;
    }
}

size_t RfbSession::handleSetEncodings(std::span<const uint8_t> in)
{
    if (in.size() < sz_rfbSetEncodingsMsg)
    {
        return 0;
    }

    auto msg = readMsg<rfbSetEncodingsMsg>(in, sz_rfbSetEncodingsMsg);
    size_t count = Swap16IfLE(msg.nEncodings);
    size_t length = sz_rfbSetEncodingsMsg + count * sizeof(uint32_t);

    if (in.size() < length)
    {
        return 0;
    }

    bool raw = false;
    bool desktopSize = false;

    for (size_t i = 0; i < count; ++i)
    {
        uint32_t encoding;

        memcpy(&encoding, in.data() + sz_rfbSetEncodingsMsg + i * 4, 4);
        encoding = Swap32IfLE(encoding);

        if (encoding == rfbEncodingRaw)
        {
            raw = true;
        }
        else if (encoding == rfbEncodingNewFBSize)
        {
            desktopSize = true;
        }
    }

    if (!raw)
    {
        log<level::ERR>("RFB client does not accept raw encoding");
        close();
        return length;
    }

    desktopSizeOffered = desktopSize;

    return length;
}

std::vector<uint8_t> RfbSession::frameUpdateHeader(const Frame& frame)
{
    std::vector<uint8_t> header;
    bool resized = frame.geometry() != geometry;

    if (resized && !desktopSizeOffered)
    {
        log<level::INFO>("RFB client cannot follow resolution change",
                         entry("WIDTH=%zu", frame.width),
                         entry("HEIGHT=%zu", frame.height));
        close();
        return header;
    }

    rfbFramebufferUpdateMsg fu;
    rfbFramebufferUpdateRectHeader rect;

    fu.type = rfbFramebufferUpdate;
    fu.pad = 0;
    fu.nRects = Swap16IfLE(static_cast<uint16_t>(resized ? 2 : 1));
    append(header, fu, sz_rfbFramebufferUpdateMsg);

    rect.r.x = 0;
    rect.r.y = 0;
    rect.r.w = Swap16IfLE(static_cast<uint16_t>(frame.width));
    rect.r.h = Swap16IfLE(static_cast<uint16_t>(frame.height));

    if (resized)
    {
        rect.encoding = Swap32IfLE(rfbEncodingNewFBSize);
        append(header, rect, sz_rfbFramebufferUpdateRectHeader);
        geometry = frame.geometry();
    }

    rect.encoding = Swap32IfLE(rfbEncodingRaw);
    append(header, rect, sz_rfbFramebufferUpdateRectHeader);

    pendingUpdate = false;

    return header;
}

rfbPixelFormat RfbSession::serverFormat()
{
    rfbPixelFormat format;

    // RGBA bytes read as a little-endian 32-bit word
    format.bitsPerPixel = 32;
    format.depth = 24;
    format.bigEndian = 0;
    format.trueColour = 1;
    format.redMax = 255;
    format.greenMax = 255;
    format.blueMax = 255;
    format.redShift = 0;
    format.greenShift = 8;
    format.blueShift = 16;
    format.pad1 = 0;
    format.pad2 = 0;

    return format;
}

} // namespace kvm
