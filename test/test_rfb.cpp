#include "kvm_rfb.hpp"

#include <rfb/keysym.h>

#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace
{

class RecordingSink : public kvm::InputSink
{
  public:
    void sendKeyboard(const kvm::KeyboardReport& report) override
    {
        keyboard.push_back(report);
    }

    void sendPointer(const kvm::PointerReport& report) override
    {
        pointer.push_back(report);
    }

    std::vector<kvm::KeyboardReport> keyboard;
    std::vector<kvm::PointerReport> pointer;
};

std::vector<uint8_t> bytes(const std::string& s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

uint16_t be16(const std::vector<uint8_t>& v, size_t at)
{
    return static_cast<uint16_t>(v[at] << 8 | v[at + 1]);
}

uint32_t be32(const std::vector<uint8_t>& v, size_t at)
{
    return static_cast<uint32_t>(v[at]) << 24 | v[at + 1] << 16 |
           v[at + 2] << 8 | v[at + 3];
}

std::vector<uint8_t> setEncodings(const std::vector<int32_t>& encodings)
{
    std::vector<uint8_t> msg = {rfbSetEncodings, 0,
                                static_cast<uint8_t>(encodings.size() >> 8),
                                static_cast<uint8_t>(encodings.size())};

    for (int32_t e : encodings)
    {
        uint32_t u = static_cast<uint32_t>(e);

        msg.push_back(u >> 24);
        msg.push_back(u >> 16);
        msg.push_back(u >> 8);
        msg.push_back(u);
    }

    return msg;
}

std::vector<uint8_t> updateRequest(bool incremental)
{
    return {rfbFramebufferUpdateRequest,
            static_cast<uint8_t>(incremental),
            0,
            0,
            0,
            0,
            0,
            4,
            0,
            3};
}

kvm::Frame makeFrame(size_t width, size_t height)
{
    kvm::Frame frame;

    frame.width = width;
    frame.height = height;
    frame.sequence = 1;
    frame.data.assign(frame.expectedSize(), 0x55);

    return frame;
}

class RfbSessionTest : public ::testing::Test
{
  protected:
    RfbSessionTest() : session({4, 3}, sink, "OpenBMC KVM")
    {}

    /* @brief Runs the 3.8 handshake up to Running */
    std::vector<uint8_t> handshake()
    {
        std::vector<uint8_t> out;
        auto in = bytes("RFB 003.008\n");

        EXPECT_EQ(session.consume(in, out), in.size());
        in = {rfbSecTypeNone};
        EXPECT_EQ(session.consume(in, out), 1u);
        out.clear();
        in = {1};
        EXPECT_EQ(session.consume(in, out), 1u);
        EXPECT_EQ(session.state(), kvm::RfbSession::State::running);

        return out;
    }

    size_t feed(const std::vector<uint8_t>& in)
    {
        std::vector<uint8_t> out;

        return session.consume(in, out);
    }

    RecordingSink sink;
    kvm::RfbSession session;
};

} // namespace

TEST(RfbGreeting, ProtocolVersion)
{
    auto greeting = kvm::RfbSession::greeting();

    EXPECT_EQ(std::string(greeting.begin(), greeting.end()), "RFB 003.008\n");
}

TEST_F(RfbSessionTest, Version38OffersNoneSecurity)
{
    std::vector<uint8_t> out;
    auto in = bytes("RFB 003.008\n");

    EXPECT_EQ(session.consume(in, out), 12u);
    EXPECT_EQ(out, (std::vector<uint8_t>{1, rfbSecTypeNone}));
    EXPECT_EQ(session.state(), kvm::RfbSession::State::awaitSecurityChoice);

    out.clear();
    in = {rfbSecTypeNone};
    session.consume(in, out);

    EXPECT_EQ(out, (std::vector<uint8_t>{0, 0, 0, 0}));
    EXPECT_EQ(session.state(), kvm::RfbSession::State::awaitClientInit);
}

TEST_F(RfbSessionTest, Version33GetsSecurityWord)
{
    std::vector<uint8_t> out;
    auto in = bytes("RFB 003.003\n");

    session.consume(in, out);

    EXPECT_EQ(session.minorVersion(), 3);
    EXPECT_EQ(out, (std::vector<uint8_t>{0, 0, 0, rfbSecTypeNone}));
    EXPECT_EQ(session.state(), kvm::RfbSession::State::awaitClientInit);
}

TEST_F(RfbSessionTest, Version37HasNoSecurityResult)
{
    std::vector<uint8_t> out;
    auto in = bytes("RFB 003.007\n");

    session.consume(in, out);
    out.clear();
    in = {rfbSecTypeNone};
    session.consume(in, out);

    EXPECT_EQ(session.minorVersion(), 7);
    EXPECT_TRUE(out.empty());
}

TEST_F(RfbSessionTest, WrongMajorCloses)
{
    EXPECT_EQ(feed(bytes("RFB 004.000\n")), 12u);
    EXPECT_EQ(session.state(), kvm::RfbSession::State::closed);
}

TEST_F(RfbSessionTest, GarbageVersionCloses)
{
    feed(bytes("GET / HTTP/1.1\r\n"));
    EXPECT_EQ(session.state(), kvm::RfbSession::State::closed);
}

TEST_F(RfbSessionTest, PartialVersionWaits)
{
    EXPECT_EQ(feed(bytes("RFB 003")), 0u);
    EXPECT_EQ(session.state(), kvm::RfbSession::State::awaitVersion);
}

TEST_F(RfbSessionTest, UnsupportedSecurityTypeCloses)
{
    feed(bytes("RFB 003.008\n"));
    feed({rfbVncAuth});
    EXPECT_EQ(session.state(), kvm::RfbSession::State::closed);
}

TEST_F(RfbSessionTest, ServerInitDescribesFramebuffer)
{
    auto init = handshake();

    ASSERT_EQ(init.size(),
              sz_rfbServerInitMsg + std::string("OpenBMC KVM").size());
    EXPECT_EQ(be16(init, 0), 4);
    EXPECT_EQ(be16(init, 2), 3);

    // pixel format starts at offset 4
    EXPECT_EQ(init[4], 32);
    EXPECT_EQ(init[5], 24);
    EXPECT_EQ(init[6], 0);
    EXPECT_EQ(init[7], 1);
    EXPECT_EQ(be16(init, 8), 255);
    EXPECT_EQ(be16(init, 10), 255);
    EXPECT_EQ(be16(init, 12), 255);
    EXPECT_EQ(init[14], 0);
    EXPECT_EQ(init[15], 8);
    EXPECT_EQ(init[16], 16);

    EXPECT_EQ(be32(init, 20), 11u);
    EXPECT_EQ(std::string(init.begin() + 24, init.end()), "OpenBMC KVM");
}

TEST_F(RfbSessionTest, UpdateRequestThenFrame)
{
    handshake();
    feed(setEncodings({rfbEncodingRaw}));

    EXPECT_FALSE(session.updateRequested());
    EXPECT_EQ(feed(updateRequest(true)), sz_rfbFramebufferUpdateRequestMsg);
    EXPECT_TRUE(session.updateRequested());

    auto frame = makeFrame(4, 3);
    auto header = session.frameUpdateHeader(frame);

    ASSERT_EQ(header.size(),
              sz_rfbFramebufferUpdateMsg + sz_rfbFramebufferUpdateRectHeader);
    EXPECT_EQ(header[0], rfbFramebufferUpdate);
    EXPECT_EQ(be16(header, 2), 1);
    EXPECT_EQ(be16(header, 4), 0);
    EXPECT_EQ(be16(header, 6), 0);
    EXPECT_EQ(be16(header, 8), 4);
    EXPECT_EQ(be16(header, 10), 3);
    EXPECT_EQ(be32(header, 12), static_cast<uint32_t>(rfbEncodingRaw));
    EXPECT_EQ(frame.data.size(), 4u * 3u * 4u);
    EXPECT_FALSE(session.updateRequested());
}

TEST_F(RfbSessionTest, SetEncodingsWithoutRawCloses)
{
    handshake();
    feed(setEncodings({rfbEncodingHextile, rfbEncodingTight}));

    EXPECT_EQ(session.state(), kvm::RfbSession::State::closed);
}

TEST_F(RfbSessionTest, SetEncodingsTwiceIsHarmless)
{
    handshake();
    feed(setEncodings({rfbEncodingTight, rfbEncodingRaw}));
    feed(setEncodings({rfbEncodingTight, rfbEncodingRaw}));

    EXPECT_EQ(session.state(), kvm::RfbSession::State::running);
}

TEST_F(RfbSessionTest, ResizeWithDesktopSize)
{
    handshake();
    feed(setEncodings({rfbEncodingRaw, rfbEncodingNewFBSize}));
    feed(updateRequest(false));

    auto frame = makeFrame(8, 6);
    auto header = session.frameUpdateHeader(frame);

    ASSERT_EQ(header.size(), sz_rfbFramebufferUpdateMsg +
                                 2 * sz_rfbFramebufferUpdateRectHeader);
    EXPECT_EQ(be16(header, 2), 2);
    EXPECT_EQ(be32(header, 12), static_cast<uint32_t>(rfbEncodingNewFBSize));
    EXPECT_EQ(session.announcedGeometry(), (kvm::Geometry{8, 6}));
}

TEST_F(RfbSessionTest, ResizeWithoutDesktopSizeCloses)
{
    handshake();
    feed(setEncodings({rfbEncodingRaw}));
    feed(updateRequest(false));

    auto frame = makeFrame(8, 6);

    EXPECT_TRUE(session.frameUpdateHeader(frame).empty());
    EXPECT_EQ(session.state(), kvm::RfbSession::State::closed);
}

TEST_F(RfbSessionTest, KeyEventReachesSink)
{
    handshake();

    std::vector<uint8_t> key = {rfbKeyEvent, 1, 0, 0, 0, 0, 0, XK_a};

    EXPECT_EQ(feed(key), sz_rfbKeyEventMsg);
    ASSERT_EQ(sink.keyboard.size(), 1u);
    EXPECT_EQ(sink.keyboard[0][2], 0x04);
}

TEST_F(RfbSessionTest, PointerEventReachesSink)
{
    handshake();

    std::vector<uint8_t> ptr = {rfbPointerEvent, 1, 0, 10, 0, 20};

    EXPECT_EQ(feed(ptr), sz_rfbPointerEventMsg);
    ASSERT_EQ(sink.pointer.size(), 1u);
    EXPECT_EQ(sink.pointer[0][0], 1);
}

TEST_F(RfbSessionTest, CutTextIsSkipped)
{
    handshake();

    std::vector<uint8_t> cut = {rfbClientCutText, 0, 0, 0, 0, 0, 0, 3,
                                'a', 'b', 'c'};
    auto fur = updateRequest(false);

    cut.insert(cut.end(), fur.begin(), fur.end());

    EXPECT_EQ(feed(cut), cut.size());
    EXPECT_EQ(session.state(), kvm::RfbSession::State::running);
    EXPECT_TRUE(session.updateRequested());
}

TEST_F(RfbSessionTest, TruncatedMessageWaits)
{
    handshake();

    std::vector<uint8_t> key = {rfbKeyEvent, 1, 0, 0};

    EXPECT_EQ(feed(key), 0u);
    EXPECT_EQ(session.state(), kvm::RfbSession::State::running);
}

TEST_F(RfbSessionTest, UnknownMessageCloses)
{
    handshake();
    feed({0xee});

    EXPECT_EQ(session.state(), kvm::RfbSession::State::closed);
}

TEST_F(RfbSessionTest, SetPixelFormatIsStored)
{
    handshake();

    std::vector<uint8_t> msg(sz_rfbSetPixelFormatMsg, 0);

    msg[0] = rfbSetPixelFormat;
    msg[4] = 16;
    msg[5] = 16;

    EXPECT_EQ(feed(msg), sz_rfbSetPixelFormatMsg);
    EXPECT_EQ(session.requestedFormat().bitsPerPixel, 16);
    EXPECT_EQ(session.state(), kvm::RfbSession::State::running);
}
