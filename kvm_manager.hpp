#pragma once

#include "kvm_args.hpp"
#include "kvm_frame_hub.hpp"
#include "kvm_input.hpp"
#include "kvm_server.hpp"
#include "kvm_session.hpp"
#include "kvm_video.hpp"
#include "kvm_websocket.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace kvm
{
/*
 * @class Manager
 * @brief Owns the capture loop, the frame hub, the HID devices and both
 *        listeners, and runs them until a signal or a capture failure
 */
class Manager
{
  public:
    /* @brief Where the Screenshot method writes its JPEG */
    static constexpr const char* screenshotPath = "/tmp/screenshot.jpg";

    /*
     * @brief Constructs Manager object. Opens the video source and binds
     *        both listeners; throws when any of them is unusable.
     *
     * @param[in] args - Reference to Args object
     */
    explicit Manager(const Args& args);
    ~Manager() = default;
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;
    Manager(Manager&&) = delete;
    Manager& operator=(Manager&&) = delete;

    /*
     * @brief Runs the daemon until shutdown
     *
     * @return Process exit status, non-zero if capture failed
     */
    int run();

    /*
     * @brief Requests a JPEG of the next captured frame
     *
     * @return The file path, or why no screenshot will be taken
     */
    std::string screenshot();

    /* @brief Stops capture and every session */
    void shutdown();

    /* @brief Context shared by the listeners and the D-Bus connection */
    boost::asio::io_context io;

  private:
    /* @brief Publishes frames while anyone is subscribed */
    void captureLoop();

    /* @brief Writes the current frame if a screenshot was requested */
    void takeScreenshot();

    /* @brief Sleeps until the deadline or until woken by shutdown */
    void idleUntil(std::chrono::steady_clock::time_point deadline);

    static std::optional<boost::asio::ssl::context> makeTls(const Args& args);

    /* @brief Frame period derived from the configured frame rate */
    std::chrono::microseconds period;
    /* @brief Runs blocking device writes off the io threads */
    boost::asio::thread_pool blocking;
    VideoSource video;
    FrameHub hub;
    Input input;
    AllowAllValidator validator;
    std::optional<boost::asio::ssl::context> tls;
    Server rfbServer;
    WebSocketServer wsServer;
    boost::asio::signal_set signals;
    /* @brief Bounds how long sessions may take to flush at shutdown */
    boost::asio::steady_timer drainTimer;
    std::atomic<bool> continueExecuting;
    std::atomic<bool> captureFailed;
    std::atomic<bool> shotFlag;
    std::mutex lock;
    std::condition_variable sync;
};

} // namespace kvm
