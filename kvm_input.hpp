#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <variant>

namespace kvm
{

constexpr size_t keyReportLength = 8;
constexpr size_t pointerReportLength = 4;

/* @brief Boot protocol keyboard report: modifiers, reserved, six keys */
using KeyboardReport = std::array<uint8_t, keyReportLength>;
/* @brief Boot protocol mouse report: buttons, dx, dy, wheel */
using PointerReport = std::array<uint8_t, pointerReportLength>;

/*
 * @struct KeyEvent
 * @brief Key press or release identified by X11 keysym
 */
struct KeyEvent
{
    uint32_t keysym;
    bool down;
};

/*
 * @struct PointerEvent
 * @brief Absolute pointer position with the RFB button mask
 */
struct PointerEvent
{
    int x;
    int y;
    uint8_t buttonMask;
};

using InputEvent = std::variant<KeyEvent, PointerEvent>;

/*
 * @class InputSink
 * @brief Destination of finished HID reports
 */
class InputSink
{
  public:
    virtual ~InputSink() = default;

    virtual void sendKeyboard(const KeyboardReport& report) = 0;
    virtual void sendPointer(const PointerReport& report) = 0;

    /* @brief A session starts sending input */
    virtual void connect()
    {}
    /* @brief A session stopped sending input */
    virtual void disconnect()
    {}
};

/*
 * @class Translator
 * @brief Turns one session's key and pointer events into HID reports. Holds
 *        the keys currently down and the last pointer position of that
 *        session.
 */
class Translator
{
  public:
    Translator();
    ~Translator() = default;
    Translator(const Translator&) = default;
    Translator& operator=(const Translator&) = default;
    Translator(Translator&&) = default;
    Translator& operator=(Translator&&) = default;

    /*
     * @brief Updates the keyboard state
     *
     * @param[in] down - Whether the key is pressed
     * @param[in] key  - X11 keysym
     *
     * @return Report to send, or nothing if the state did not change
     */
    std::optional<KeyboardReport> keyEvent(bool down, uint32_t key);

    /*
     * @brief Converts an absolute position to relative motion
     *
     * @param[in] buttonMask - RFB button mask, bits 3 and 4 are the wheel
     * @param[in] x          - Pointer x-coordinate
     * @param[in] y          - Pointer y-coordinate
     */
    PointerReport pointerEvent(uint8_t buttonMask, int x, int y);

    /* @brief Translates the event and hands any report to the sink */
    void apply(const InputEvent& event, InputSink& sink);

    /* @brief HID modifier bit for a keysym, 0 if not a modifier */
    static uint8_t keyToMod(uint32_t key);
    /* @brief HID usage ID for a keysym, 0 if unmapped */
    static uint8_t keyToScancode(uint32_t key);

  private:
    KeyboardReport keyboardReport;
    /* @brief Usage ID of each pressed key to its slot in the report */
    std::map<uint8_t, size_t> keysDown;
    bool havePosition;
    int lastX;
    int lastY;
};

/*
 * @class Input
 * @brief Writes HID reports to the USB gadget keyboard and mouse devices.
 *        Reports to one device are never interleaved.
 */
class Input : public InputSink
{
  public:
    /* @brief Writes retried while the gadget reports EAGAIN */
    static constexpr unsigned int retryMax = 5;

    /*
     * @brief Constructs Input object
     *
     * @param[in] kbdPath  - Path to the USB keyboard device
     * @param[in] ptrPath  - Path to the USB mouse device
     * @param[in] blocking - Executor on which device writes may block
     */
    Input(const std::string& kbdPath, const std::string& ptrPath,
          const boost::asio::any_io_executor& blocking);
    ~Input() override;
    Input(const Input&) = delete;
    Input& operator=(const Input&) = delete;
    Input(Input&&) = delete;
    Input& operator=(Input&&) = delete;

    /*
     * @brief Writes a keyboard report now, on the calling thread
     *
     * @return False if the report was dropped
     */
    bool writeKeyboard(std::span<const uint8_t> report);
    /*
     * @brief Writes a pointer report now, on the calling thread
     *
     * @return False if the report was dropped
     */
    bool writePointer(std::span<const uint8_t> report);

    /* @brief Queues a keyboard report on the blocking executor */
    void sendKeyboard(const KeyboardReport& report) override;
    /* @brief Queues a pointer report on the blocking executor */
    void sendPointer(const PointerReport& report) override;

    /* @brief Counts a new session */
    void connect() override;
    /*
     * @brief Counts a finished session; when none is left, releases every
     *        key and button so nothing stays latched on the host
     */
    void disconnect() override;

  private:
    struct Device
    {
        Device(const char* n, const std::string& p, size_t len) :
            name(n), path(p), reportLength(len), fd(-1), failing(false)
        {}

        const char* name;
        std::string path;
        size_t reportLength;
        int fd;
        /* @brief Set after a logged failure, cleared by the next success */
        bool failing;
        std::mutex mutex;
    };

    static bool openDevice(Device& dev);
    static void closeDevice(Device& dev);
    static bool writeReport(Device& dev, std::span<const uint8_t> report);

    Device keyboard;
    Device pointer;
    std::mutex sessionLock;
    unsigned int sessions;
    /* @brief Keeps queued keyboard reports in arrival order */
    boost::asio::strand<boost::asio::any_io_executor> keyboardStrand;
    /* @brief Keeps queued pointer reports in arrival order */
    boost::asio::strand<boost::asio::any_io_executor> pointerStrand;
};

} // namespace kvm
