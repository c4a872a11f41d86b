#include "kvm_input.hpp"

#include "kvm_scancodes.hpp"

#include <errno.h>
#include <fcntl.h>
#include <rfb/keysym.h>
#include <unistd.h>

#include <boost/asio/post.hpp>
#include <phosphor-logging/log.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

namespace kvm
{

using namespace phosphor::logging;

namespace
{

/* @brief HID modifier bits for XK_Shift_L through XK_Control_R */
constexpr uint8_t shiftCtrlMap[] = {USBHID_MOD_LEFTSHIFT, USBHID_MOD_RIGHTSHIFT,
                                    USBHID_MOD_LEFTCTRL, USBHID_MOD_RIGHTCTRL};

/* @brief HID modifier bits for XK_Meta_L through XK_Super_R */
constexpr uint8_t metaAltMap[] = {USBHID_MOD_LEFTMETA, USBHID_MOD_RIGHTMETA,
                                  USBHID_MOD_LEFTALT,  USBHID_MOD_RIGHTALT,
                                  USBHID_MOD_LEFTMETA, USBHID_MOD_RIGHTMETA};

struct KeyMapping
{
    uint32_t key;
    uint8_t scancode;
};

// keysyms outside the contiguous ranges handled in keyToScancode
constexpr KeyMapping keyTable[] = {
    {XK_exclam, USBHID_KEY_1},
    {XK_at, USBHID_KEY_2},
    {XK_numbersign, USBHID_KEY_3},
    {XK_dollar, USBHID_KEY_4},
    {XK_percent, USBHID_KEY_5},
    {XK_asciicircum, USBHID_KEY_6},
    {XK_ampersand, USBHID_KEY_7},
    {XK_asterisk, USBHID_KEY_8},
    {XK_parenleft, USBHID_KEY_9},
    {XK_0, USBHID_KEY_0},
    {XK_parenright, USBHID_KEY_0},
    {XK_Return, USBHID_KEY_RETURN},
    {XK_Escape, USBHID_KEY_ESC},
    {XK_BackSpace, USBHID_KEY_BACKSPACE},
    {XK_Tab, USBHID_KEY_TAB},
    {XK_KP_Tab, USBHID_KEY_TAB},
    {XK_space, USBHID_KEY_SPACE},
    {XK_KP_Space, USBHID_KEY_SPACE},
    {XK_minus, USBHID_KEY_MINUS},
    {XK_underscore, USBHID_KEY_MINUS},
    {XK_plus, USBHID_KEY_EQUAL},
    {XK_equal, USBHID_KEY_EQUAL},
    {XK_bracketleft, USBHID_KEY_LEFTBRACE},
    {XK_braceleft, USBHID_KEY_LEFTBRACE},
    {XK_bracketright, USBHID_KEY_RIGHTBRACE},
    {XK_braceright, USBHID_KEY_RIGHTBRACE},
    {XK_backslash, USBHID_KEY_BACKSLASH},
    {XK_bar, USBHID_KEY_BACKSLASH},
    {XK_colon, USBHID_KEY_SEMICOLON},
    {XK_semicolon, USBHID_KEY_SEMICOLON},
    {XK_quotedbl, USBHID_KEY_APOSTROPHE},
    {XK_apostrophe, USBHID_KEY_APOSTROPHE},
    {XK_grave, USBHID_KEY_GRAVE},
    {XK_asciitilde, USBHID_KEY_GRAVE},
    {XK_comma, USBHID_KEY_COMMA},
    {XK_less, USBHID_KEY_COMMA},
    {XK_period, USBHID_KEY_DOT},
    {XK_greater, USBHID_KEY_DOT},
    {XK_slash, USBHID_KEY_SLASH},
    {XK_question, USBHID_KEY_SLASH},
    {XK_Caps_Lock, USBHID_KEY_CAPSLOCK},
    {XK_Print, USBHID_KEY_PRINT},
    {XK_Scroll_Lock, USBHID_KEY_SCROLLLOCK},
    {XK_Pause, USBHID_KEY_PAUSE},
    {XK_Insert, USBHID_KEY_INSERT},
    {XK_KP_Insert, USBHID_KEY_INSERT},
    {XK_Home, USBHID_KEY_HOME},
    {XK_KP_Home, USBHID_KEY_HOME},
    {XK_Page_Up, USBHID_KEY_PAGEUP},
    {XK_KP_Page_Up, USBHID_KEY_PAGEUP},
    {XK_Delete, USBHID_KEY_DELETE},
    {XK_KP_Delete, USBHID_KEY_DELETE},
    {XK_End, USBHID_KEY_END},
    {XK_KP_End, USBHID_KEY_END},
    {XK_Page_Down, USBHID_KEY_PAGEDOWN},
    {XK_KP_Page_Down, USBHID_KEY_PAGEDOWN},
    {XK_Right, USBHID_KEY_RIGHT},
    {XK_KP_Right, USBHID_KEY_RIGHT},
    {XK_Left, USBHID_KEY_LEFT},
    {XK_KP_Left, USBHID_KEY_LEFT},
    {XK_Down, USBHID_KEY_DOWN},
    {XK_KP_Down, USBHID_KEY_DOWN},
    {XK_Up, USBHID_KEY_UP},
    {XK_KP_Up, USBHID_KEY_UP},
    {XK_Num_Lock, USBHID_KEY_NUMLOCK},
    {XK_Menu, USBHID_KEY_APPLICATION},
    {XK_KP_Enter, USBHID_KEY_KP_ENTER},
    {XK_KP_Equal, USBHID_KEY_KP_EQUAL},
    {XK_KP_Multiply, USBHID_KEY_KP_MULTIPLY},
    {XK_KP_Add, USBHID_KEY_KP_ADD},
    {XK_KP_Subtract, USBHID_KEY_KP_SUBTRACT},
    {XK_KP_Decimal, USBHID_KEY_KP_DECIMAL},
    {XK_KP_Divide, USBHID_KEY_KP_DIVIDE},
    {XK_KP_0, USBHID_KEY_KP_0},
};

inline int8_t clampMotion(int delta)
{
    return static_cast<int8_t>(std::clamp(delta, -127, 127));
}

} // namespace

Translator::Translator() :
    keyboardReport{0}, havePosition(false), lastX(0), lastY(0)
{}

std::optional<KeyboardReport> Translator::keyEvent(bool down, uint32_t key)
{
    uint8_t sc = keyToScancode(key);
    bool changed = false;

    if (sc)
    {
        auto it = keysDown.find(sc);

        if (down)
        {
            if (it != keysDown.end())
            {
                return std::nullopt;
            }

            for (size_t i = 2; i < keyReportLength; ++i)
            {
                if (!keyboardReport[i])
                {
                    keyboardReport[i] = sc;
                    keysDown.emplace(sc, i);
                    changed = true;
                    break;
                }
            }
        }
        else if (it != keysDown.end())
        {
            keyboardReport[it->second] = 0;
            keysDown.erase(it);
            changed = true;
        }
    }
    else
    {
        uint8_t mod = keyToMod(key);

        if (mod)
        {
            uint8_t before = keyboardReport[0];

            if (down)
            {
                keyboardReport[0] |= mod;
            }
            else
            {
                keyboardReport[0] &= ~mod;
            }

            changed = keyboardReport[0] != before;
        }
    }

    if (!changed)
    {
        return std::nullopt;
    }

    return keyboardReport;
}

PointerReport Translator::pointerEvent(uint8_t buttonMask, int x, int y)
{
    PointerReport report{0};

    report[0] = ((buttonMask & 0x4) >> 1) | ((buttonMask & 0x2) << 1) |
                (buttonMask & 0x1);

    if (buttonMask & 0x8)
    {
        report[3] = 1;
    }
    else if (buttonMask & 0x10)
    {
        report[3] = 0xff;
    }

    if (havePosition)
    {
        int8_t dx = clampMotion(x - lastX);
        int8_t dy = clampMotion(y - lastY);

        report[1] = static_cast<uint8_t>(dx);
        report[2] = static_cast<uint8_t>(dy);

        // anything clamped away is sent with the next event
        lastX += dx;
        lastY += dy;
    }
    else
    {
        havePosition = true;
        lastX = x;
        lastY = y;
    }

    return report;
}

void Translator::apply(const InputEvent& event, InputSink& sink)
{
    if (const auto* key = std::get_if<KeyEvent>(&event))
    {
        auto report = keyEvent(key->down, key->keysym);

        if (report)
        {
            sink.sendKeyboard(*report);
        }
    }
    else
    {
        const auto& ptr = std::get<PointerEvent>(event);

        sink.sendPointer(pointerEvent(ptr.buttonMask, ptr.x, ptr.y));
    }
}

uint8_t Translator::keyToMod(uint32_t key)
{
    uint8_t mod = 0;

    if (key >= XK_Shift_L && key <= XK_Control_R)
    {
        mod = shiftCtrlMap[key - XK_Shift_L];
    }
    else if (key >= XK_Meta_L && key <= XK_Super_R)
    {
        mod = metaAltMap[key - XK_Meta_L];
    }

    return mod;
}

uint8_t Translator::keyToScancode(uint32_t key)
{
    if ((key >= 'A' && key <= 'Z') || (key >= 'a' && key <= 'z'))
    {
        return USBHID_KEY_A + ((key & 0x5F) - 'A');
    }
    if (key >= '1' && key <= '9')
    {
        return USBHID_KEY_1 + (key - '1');
    }
    if (key >= XK_F1 && key <= XK_F12)
    {
        return USBHID_KEY_F1 + (key - XK_F1);
    }
    if (key >= XK_KP_F1 && key <= XK_KP_F4)
    {
        return USBHID_KEY_F1 + (key - XK_KP_F1);
    }
    if (key >= XK_KP_1 && key <= XK_KP_9)
    {
        return USBHID_KEY_KP_1 + (key - XK_KP_1);
    }

    for (const auto& mapping : keyTable)
    {
        if (mapping.key == key)
        {
            return mapping.scancode;
        }
    }

    return 0;
}

Input::Input(const std::string& kbdPath, const std::string& ptrPath,
             const boost::asio::any_io_executor& blocking) :
    keyboard("keyboard", kbdPath, keyReportLength),
    pointer("pointer", ptrPath, pointerReportLength), sessions(0),
    keyboardStrand(boost::asio::make_strand(blocking)),
    pointerStrand(boost::asio::make_strand(blocking))
{
    // a missing gadget is tolerated; writes reopen on demand
    std::lock_guard<std::mutex> klk(keyboard.mutex);
    openDevice(keyboard);
    std::lock_guard<std::mutex> plk(pointer.mutex);
    openDevice(pointer);
}

Input::~Input()
{
    closeDevice(keyboard);
    closeDevice(pointer);
}

bool Input::writeKeyboard(std::span<const uint8_t> report)
{
    return writeReport(keyboard, report);
}

bool Input::writePointer(std::span<const uint8_t> report)
{
    return writeReport(pointer, report);
}

void Input::sendKeyboard(const KeyboardReport& report)
{
    boost::asio::post(keyboardStrand,
                      [this, report]() { writeKeyboard(report); });
}

void Input::sendPointer(const PointerReport& report)
{
    boost::asio::post(pointerStrand,
                      [this, report]() { writePointer(report); });
}

void Input::connect()
{
    std::lock_guard<std::mutex> lk(sessionLock);

    sessions++;
}

void Input::disconnect()
{
    std::lock_guard<std::mutex> lk(sessionLock);

    if (sessions && !--sessions)
    {
        sendKeyboard(KeyboardReport{0});
        sendPointer(PointerReport{0});
    }
}

bool Input::openDevice(Device& dev)
{
    if (dev.path.empty())
    {
        return false;
    }

    dev.fd = open(dev.path.c_str(), O_RDWR | O_CLOEXEC | O_NONBLOCK);
    if (dev.fd < 0)
    {
        if (!dev.failing)
        {
            log<level::ERR>("Failed to open input device",
                            entry("DEVICE=%s", dev.name),
                            entry("PATH=%s", dev.path.c_str()),
                            entry("ERROR=%s", strerror(errno)));
            dev.failing = true;
        }
        return false;
    }

    return true;
}

void Input::closeDevice(Device& dev)
{
    if (dev.fd >= 0)
    {
        close(dev.fd);
        dev.fd = -1;
    }
}

bool Input::writeReport(Device& dev, std::span<const uint8_t> report)
{
    std::unique_lock<std::mutex> lk(dev.mutex);
    unsigned int retryCount = retryMax;

    if (report.size() != dev.reportLength)
    {
        log<level::ERR>("Dropped HID report of wrong length",
                        entry("DEVICE=%s", dev.name),
                        entry("LENGTH=%zu", report.size()));
        return false;
    }

    if (dev.fd < 0 && !openDevice(dev))
    {
        return false;
    }

    while (retryCount > 0)
    {
        ssize_t rc = write(dev.fd, report.data(), report.size());

        if (rc == static_cast<ssize_t>(report.size()))
        {
            dev.failing = false;
            return true;
        }

        if (rc >= 0 || errno != EAGAIN)
        {
            int err = rc >= 0 ? EIO : errno;

            // ESHUTDOWN: the host has not configured the gadget
            if (err != ESHUTDOWN && !dev.failing)
            {
                log<level::ERR>("Failed to write HID report",
                                entry("DEVICE=%s", dev.name),
                                entry("ERROR=%s", strerror(err)));
            }

            dev.failing = true;
            closeDevice(dev);
            return false;
        }

        lk.unlock();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        lk.lock();
        retryCount--;

        if (dev.fd < 0)
        {
            return false;
        }
    }

    log<level::ERR>("HID device busy, report dropped",
                    entry("DEVICE=%s", dev.name));

    return false;
}

} // namespace kvm
