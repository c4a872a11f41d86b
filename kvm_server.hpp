#pragma once

#include "kvm_frame_hub.hpp"
#include "kvm_input.hpp"
#include "kvm_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include <list>
#include <memory>
#include <mutex>
#include <string>

namespace kvm
{

/*
 * @class Server
 * @brief Accepts RFB clients, optionally over TLS, and runs one RfbSession
 *        per connection
 */
class Server
{
  public:
    /* @brief Desktop name announced to RFB clients */
    static constexpr const char* desktopName = "OpenBMC KVM";

    /*
     * @brief Constructs Server object and starts listening
     *
     * @param[in] io        - Context that runs the connections
     * @param[in] endpoint  - Address and port to listen on
     * @param[in] hub       - Source of frames
     * @param[in] input     - Destination of HID reports
     * @param[in] validator - Gate for new connections
     * @param[in] tls       - TLS context, or nullptr for plain RFB
     */
    Server(boost::asio::io_context& io,
           const boost::asio::ip::tcp::endpoint& endpoint, FrameHub& hub,
           InputSink& input, SessionValidator& validator,
           boost::asio::ssl::context* tls);
    ~Server() = default;
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /* @brief Starts accepting connections */
    void run();

    /* @brief Stops accepting and closes every connection */
    void stop();

    /* @brief Port actually bound, useful when asked for port 0 */
    uint16_t port() const;

  private:
    void doAccept();
    void track(const std::shared_ptr<Connection>& conn);

    boost::asio::io_context& io;
    boost::asio::ip::tcp::acceptor acceptor;
    FrameHub& hub;
    InputSink& input;
    SessionValidator& validator;
    boost::asio::ssl::context* tls;
    std::mutex lock;
    std::list<std::weak_ptr<Connection>> connections;
};

} // namespace kvm
