#include "kvm_input.hpp"
#include "kvm_scancodes.hpp"

#include <rfb/keysym.h>
#include <stdlib.h>
#include <unistd.h>

#include <boost/asio/thread_pool.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include <gtest/gtest.h>

namespace
{

/* @brief Records reports instead of writing them */
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

class TempFile
{
  public:
    TempFile()
    {
        char name[] = "/tmp/kvm-input-XXXXXX";
        int fd = mkstemp(name);

        if (fd >= 0)
        {
            ::close(fd);
        }
        path = name;
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::vector<uint8_t> contents() const
    {
        std::ifstream file(path, std::ios::binary);

        return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                    std::istreambuf_iterator<char>());
    }

    std::string path;
};

} // namespace

TEST(Translator, LetterPressAndRelease)
{
    kvm::Translator translator;

    auto down = translator.keyEvent(true, XK_a);

    ASSERT_TRUE(down);
    EXPECT_EQ((*down)[0], 0);
    EXPECT_EQ((*down)[2], USBHID_KEY_A);

    auto up = translator.keyEvent(false, XK_a);

    ASSERT_TRUE(up);
    EXPECT_EQ(*up, kvm::KeyboardReport{});
}

TEST(Translator, ShiftedAndUnshiftedShareScancode)
{
    EXPECT_EQ(kvm::Translator::keyToScancode(XK_A),
              kvm::Translator::keyToScancode(XK_a));
    EXPECT_EQ(kvm::Translator::keyToScancode(XK_exclam), USBHID_KEY_1);
    EXPECT_EQ(kvm::Translator::keyToScancode(XK_F12), USBHID_KEY_F12);
    EXPECT_EQ(kvm::Translator::keyToScancode(XK_Return), USBHID_KEY_RETURN);
}

TEST(Translator, ModifiersSetBits)
{
    kvm::Translator translator;

    auto shift = translator.keyEvent(true, XK_Shift_L);

    ASSERT_TRUE(shift);
    EXPECT_EQ((*shift)[0], USBHID_MOD_LEFTSHIFT);

    auto ctrl = translator.keyEvent(true, XK_Control_R);

    ASSERT_TRUE(ctrl);
    EXPECT_EQ((*ctrl)[0], USBHID_MOD_LEFTSHIFT | USBHID_MOD_RIGHTCTRL);

    auto released = translator.keyEvent(false, XK_Shift_L);

    ASSERT_TRUE(released);
    EXPECT_EQ((*released)[0], USBHID_MOD_RIGHTCTRL);
}

TEST(Translator, UnmappedKeyIsDropped)
{
    kvm::Translator translator;

    EXPECT_FALSE(translator.keyEvent(true, 0xfffffe));
}

TEST(Translator, RepeatedPressIsNotResent)
{
    kvm::Translator translator;

    EXPECT_TRUE(translator.keyEvent(true, XK_b));
    EXPECT_FALSE(translator.keyEvent(true, XK_b));
}

TEST(Translator, SixKeysAtMost)
{
    kvm::Translator translator;
    const uint32_t keys[] = {XK_a, XK_b, XK_c, XK_d, XK_e, XK_f};

    for (auto key : keys)
    {
        ASSERT_TRUE(translator.keyEvent(true, key));
    }

    EXPECT_FALSE(translator.keyEvent(true, XK_g));

    auto up = translator.keyEvent(false, XK_c);

    ASSERT_TRUE(up);
    EXPECT_EQ((*up)[4], 0);

    auto g = translator.keyEvent(true, XK_g);

    ASSERT_TRUE(g);
    EXPECT_EQ((*g)[4], USBHID_KEY_G);
}

TEST(Translator, FirstPointerEventHasNoMotion)
{
    kvm::Translator translator;

    auto report = translator.pointerEvent(0, 500, 300);

    EXPECT_EQ(report, kvm::PointerReport{});
}

TEST(Translator, PointerMotionIsRelativeAndClamped)
{
    kvm::Translator translator;

    translator.pointerEvent(0, 100, 100);

    auto small = translator.pointerEvent(0, 110, 95);

    EXPECT_EQ(static_cast<int8_t>(small[1]), 10);
    EXPECT_EQ(static_cast<int8_t>(small[2]), -5);

    auto big = translator.pointerEvent(0, 410, 95);

    EXPECT_EQ(static_cast<int8_t>(big[1]), 127);

    // the clamped remainder follows with the next event
    auto rest = translator.pointerEvent(0, 410, 95);

    EXPECT_EQ(static_cast<int8_t>(rest[1]), 127);
}

TEST(Translator, ButtonsAndWheel)
{
    kvm::Translator translator;

    EXPECT_EQ(translator.pointerEvent(0x1, 0, 0)[0], 0x1);
    EXPECT_EQ(translator.pointerEvent(0x2, 0, 0)[0], 0x4);
    EXPECT_EQ(translator.pointerEvent(0x4, 0, 0)[0], 0x2);
    EXPECT_EQ(translator.pointerEvent(0x8, 0, 0)[3], 0x01);
    EXPECT_EQ(translator.pointerEvent(0x10, 0, 0)[3], 0xff);
}

TEST(Translator, ApplyRoutesToSink)
{
    kvm::Translator translator;
    RecordingSink sink;

    translator.apply(kvm::KeyEvent{XK_a, true}, sink);
    translator.apply(kvm::PointerEvent{1, 1, 0}, sink);
    translator.apply(kvm::KeyEvent{0xfffffe, true}, sink);

    EXPECT_EQ(sink.keyboard.size(), 1u);
    EXPECT_EQ(sink.pointer.size(), 1u);
}

TEST(Input, WritesKeyboardReport)
{
    TempFile kbd;
    TempFile ptr;
    boost::asio::thread_pool pool(1);

    {
        kvm::Input input(kbd.path, ptr.path, pool.get_executor());
        kvm::KeyboardReport report = {0, 0, 4, 0, 0, 0, 0, 0};

        EXPECT_TRUE(input.writeKeyboard(report));
    }

    EXPECT_EQ(kbd.contents(),
              (std::vector<uint8_t>{0, 0, 4, 0, 0, 0, 0, 0}));
    EXPECT_TRUE(ptr.contents().empty());
}

TEST(Input, RejectsWrongLength)
{
    TempFile kbd;
    TempFile ptr;
    boost::asio::thread_pool pool(1);
    kvm::Input input(kbd.path, ptr.path, pool.get_executor());
    const uint8_t shortReport[] = {1, 2, 3};

    EXPECT_FALSE(input.writeKeyboard(shortReport));
    EXPECT_FALSE(input.writePointer(shortReport));
    pool.join();
}

TEST(Input, MissingDeviceDropsReport)
{
    boost::asio::thread_pool pool(1);
    kvm::Input input("/nonexistent/hidg0", "/nonexistent/hidg1",
                     pool.get_executor());

    EXPECT_FALSE(input.writePointer(kvm::PointerReport{1, 0, 0, 0}));
    pool.join();
}

TEST(Input, QueuedReportsKeepOrder)
{
    TempFile kbd;
    TempFile ptr;
    boost::asio::thread_pool pool(4);

    {
        kvm::Input input(kbd.path, ptr.path, pool.get_executor());

        for (uint8_t i = 1; i <= 20; ++i)
        {
            input.sendPointer(kvm::PointerReport{i, 0, 0, 0});
        }

        pool.join();
    }

    auto written = ptr.contents();

    ASSERT_EQ(written.size(), 20u * kvm::pointerReportLength);
    for (size_t i = 0; i < 20; ++i)
    {
        EXPECT_EQ(written[i * kvm::pointerReportLength], i + 1);
    }
}

TEST(Input, LastDisconnectReleasesEverything)
{
    TempFile kbd;
    TempFile ptr;
    boost::asio::thread_pool pool(1);

    {
        kvm::Input input(kbd.path, ptr.path, pool.get_executor());

        input.connect();
        input.connect();
        input.disconnect();
        input.disconnect();
        pool.join();
    }

    EXPECT_EQ(kbd.contents(), std::vector<uint8_t>(kvm::keyReportLength, 0));
    EXPECT_EQ(ptr.contents(),
              std::vector<uint8_t>(kvm::pointerReportLength, 0));
}
