#pragma once

#include <cstdint>

// USB HID usage IDs, keyboard/keypad page (0x07)

namespace kvm
{

enum : uint8_t
{
    USBHID_KEY_A = 0x04,
    USBHID_KEY_1 = 0x1e,
    USBHID_KEY_2 = 0x1f,
    USBHID_KEY_3 = 0x20,
    USBHID_KEY_4 = 0x21,
    USBHID_KEY_5 = 0x22,
    USBHID_KEY_6 = 0x23,
    USBHID_KEY_7 = 0x24,
    USBHID_KEY_8 = 0x25,
    USBHID_KEY_9 = 0x26,
    USBHID_KEY_0 = 0x27,
    USBHID_KEY_RETURN = 0x28,
    USBHID_KEY_ESC = 0x29,
    USBHID_KEY_BACKSPACE = 0x2a,
    USBHID_KEY_TAB = 0x2b,
    USBHID_KEY_SPACE = 0x2c,
    USBHID_KEY_MINUS = 0x2d,
    USBHID_KEY_EQUAL = 0x2e,
    USBHID_KEY_LEFTBRACE = 0x2f,
    USBHID_KEY_RIGHTBRACE = 0x30,
    USBHID_KEY_BACKSLASH = 0x31,
    USBHID_KEY_SEMICOLON = 0x33,
    USBHID_KEY_APOSTROPHE = 0x34,
    USBHID_KEY_GRAVE = 0x35,
    USBHID_KEY_COMMA = 0x36,
    USBHID_KEY_DOT = 0x37,
    USBHID_KEY_SLASH = 0x38,
    USBHID_KEY_CAPSLOCK = 0x39,
    USBHID_KEY_F1 = 0x3a,
    USBHID_KEY_PRINT = 0x46,
    USBHID_KEY_SCROLLLOCK = 0x47,
    USBHID_KEY_PAUSE = 0x48,
    USBHID_KEY_INSERT = 0x49,
    USBHID_KEY_HOME = 0x4a,
    USBHID_KEY_PAGEUP = 0x4b,
    USBHID_KEY_DELETE = 0x4c,
    USBHID_KEY_END = 0x4d,
    USBHID_KEY_PAGEDOWN = 0x4e,
    USBHID_KEY_RIGHT = 0x4f,
    USBHID_KEY_LEFT = 0x50,
    USBHID_KEY_DOWN = 0x51,
    USBHID_KEY_UP = 0x52,
    USBHID_KEY_NUMLOCK = 0x53,
    USBHID_KEY_KP_DIVIDE = 0x54,
    USBHID_KEY_KP_MULTIPLY = 0x55,
    USBHID_KEY_KP_SUBTRACT = 0x56,
    USBHID_KEY_KP_ADD = 0x57,
    USBHID_KEY_KP_ENTER = 0x58,
    USBHID_KEY_KP_1 = 0x59,
    USBHID_KEY_KP_0 = 0x62,
    USBHID_KEY_KP_DECIMAL = 0x63,
    USBHID_KEY_APPLICATION = 0x65,
    USBHID_KEY_KP_EQUAL = 0x67
};

// modifier byte of the boot keyboard report
enum : uint8_t
{
    USBHID_MOD_LEFTCTRL = 0x01,
    USBHID_MOD_LEFTSHIFT = 0x02,
    USBHID_MOD_LEFTALT = 0x04,
    USBHID_MOD_LEFTMETA = 0x08,
    USBHID_MOD_RIGHTCTRL = 0x10,
    USBHID_MOD_RIGHTSHIFT = 0x20,
    USBHID_MOD_RIGHTALT = 0x40,
    USBHID_MOD_RIGHTMETA = 0x80
};

} // namespace kvm
