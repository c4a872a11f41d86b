#pragma once

#include "kvm_frame_hub.hpp"
#include "kvm_input.hpp"
#include "kvm_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <list>
#include <memory>
#include <mutex>
#include <span>

namespace kvm
{

/* @brief Message tag of a keyboard report from the browser client */
constexpr uint8_t keyboardTag = 0x01;
/* @brief Message tag of a pointer report from the browser client */
constexpr uint8_t pointerTag = 0x02;

/*
 * @brief Hands one inbound binary message to the matching HID device. The
 *        first byte is the tag, the rest a complete boot protocol report.
 *
 * @param[in] message - Whole web-socket message
 * @param[in] sink    - Destination of the report
 *
 * @return False if the message was ignored
 */
bool routeInputMessage(std::span<const uint8_t> message, InputSink& sink);

/*
 * @class WebSocketServer
 * @brief HTTP listener that upgrades requests for the KVM path to web-socket
 *        sessions streaming raw RGBA frames
 */
class WebSocketServer
{
  public:
    static constexpr const char* kvmPath = "/kvm/0";

    /*
     * @brief Constructs WebSocketServer object and starts listening
     *
     * @param[in] io        - Context that runs the sessions
     * @param[in] endpoint  - Address and port to listen on
     * @param[in] hub       - Source of frames
     * @param[in] input     - Destination of HID reports
     * @param[in] validator - Gate for new connections
     */
    WebSocketServer(boost::asio::io_context& io,
                    const boost::asio::ip::tcp::endpoint& endpoint,
                    FrameHub& hub, InputSink& input,
                    SessionValidator& validator);
    ~WebSocketServer() = default;
    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;
    WebSocketServer(WebSocketServer&&) = delete;
    WebSocketServer& operator=(WebSocketServer&&) = delete;

    void run();
    void stop();
    uint16_t port() const;

  private:
    void doAccept();

    boost::asio::io_context& io;
    boost::asio::ip::tcp::acceptor acceptor;
    FrameHub& hub;
    InputSink& input;
    SessionValidator& validator;
    std::mutex lock;
    std::list<std::weak_ptr<Connection>> connections;
};

} // namespace kvm
