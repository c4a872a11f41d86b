#include "kvm_websocket.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <phosphor-logging/log.hpp>

#include <algorithm>
#include <chrono>

namespace kvm
{

using namespace phosphor::logging;
using boost::asio::ip::tcp;

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

namespace
{

constexpr auto requestTimeout = std::chrono::seconds(30);
/*
 * @brief Largest inbound message. Input reports are a few bytes; anything
 *        longer up to this size is dropped by the router, not the stream.
 */
constexpr size_t maxInboundMessage = 64 * 1024;

/*
 * @class WebSocketConnection
 * @brief Reads one HTTP request, upgrades it when it asks for the KVM path
 *        and then streams frames out while routing input reports in. Every
 *        handler runs on the strand the socket was accepted on.
 */
class WebSocketConnection :
    public Connection,
    public std::enable_shared_from_this<WebSocketConnection>
{
  public:
    WebSocketConnection(tcp::socket&& socket, const ConnectionInfo& i,
                        FrameHub& h, InputSink& in, SessionValidator& v) :
        ws(std::move(socket)), info(i), hub(h), input(in), validator(v),
        connected(false), waiting(false), writing(false), closing(false),
        finished(false)
    {}

    void start() override
    {
        boost::asio::dispatch(ws.get_executor(),
                              [self = shared_from_this()]() {
                                  self->readRequest();
                              });
    }

    void stop() override
    {
        boost::asio::post(ws.get_executor(), [self = shared_from_this()]() {
            self->closeAfterWrites();
        });
    }

  private:
    void readRequest()
    {
        if (!validator.authorize(info))
        {
            log<level::INFO>("Web-socket connection rejected",
                             entry("ADDRESS=%s", info.remoteAddress.c_str()));
            finish();
            return;
        }

        beast::get_lowest_layer(ws).expires_after(requestTimeout);
        http::async_read(ws.next_layer(), buffer, request,
                         [self = shared_from_this()](
                             const beast::error_code& ec, size_t) {
                             self->onRequest(ec);
                         });
    }

    void onRequest(const beast::error_code& ec)
    {
        if (ec)
        {
            log<level::DEBUG>("Failed to read HTTP request",
                              entry("ERROR=%s", ec.message().c_str()));
            finish();
            return;
        }

        if (!websocket::is_upgrade(request) ||
            request.target() != WebSocketServer::kvmPath)
        {
            log<level::DEBUG>(
                "Rejecting HTTP request",
                entry("TARGET=%s", std::string(request.target()).c_str()));
            notFound();
            return;
        }

        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(
            beast::role_type::server));
        ws.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, "obmc-kvm");
            }));
        ws.read_message_max(maxInboundMessage);
        ws.binary(true);

        ws.async_accept(request, [self = shared_from_this()](
                                     const beast::error_code& ec) {
            self->onAccept(ec);
        });
    }

    void notFound()
    {
        auto res = std::make_shared<http::response<http::string_body>>(
            http::status::not_found, request.version());

        res->set(http::field::server, "obmc-kvm");
        res->set(http::field::content_type, "text/plain");
        res->keep_alive(false);
        res->body() = "Not found\n";
        res->prepare_payload();

        http::async_write(ws.next_layer(), *res,
                          [self = shared_from_this(),
                           res](const beast::error_code&, size_t) {
                              self->finish();
                          });
    }

    void onAccept(const beast::error_code& ec)
    {
        if (ec)
        {
            log<level::ERR>("Web-socket upgrade failed",
                            entry("ADDRESS=%s", info.remoteAddress.c_str()),
                            entry("ERROR=%s", ec.message().c_str()));
            finish();
            return;
        }

        log<level::INFO>("Web-socket client connected",
                         entry("ADDRESS=%s", info.remoteAddress.c_str()),
                         entry("PORT=%u", info.remotePort));

        buffer.clear();
        input.connect();
        connected = true;
        subscription = hub.subscribe(ws.get_executor());

        doRead();
        waitFrame();
    }

    void doRead()
    {
        ws.async_read(buffer, [self = shared_from_this()](
                                  const beast::error_code& ec, size_t) {
            self->onRead(ec);
        });
    }

    void onRead(const beast::error_code& ec)
    {
        if (ec)
        {
            if (ec != websocket::error::closed &&
                ec != boost::asio::error::operation_aborted)
            {
                log<level::DEBUG>("Web-socket read failed",
                                  entry("ERROR=%s", ec.message().c_str()));
            }
            finish();
            return;
        }

        if (ws.got_binary())
        {
            auto data = buffer.cdata();

            routeInputMessage(
                std::span<const uint8_t>(
                    static_cast<const uint8_t*>(data.data()), data.size()),
                input);
        }
        else
        {
            log<level::DEBUG>("Ignoring text message from web-socket client");
        }

        buffer.consume(buffer.size());
        doRead();
    }

    void waitFrame()
    {
        if (waiting || writing || closing)
        {
            return;
        }

        waiting = true;
        subscription->asyncWait(
            [self = shared_from_this()](std::shared_ptr<const Frame> frame) {
                self->onFrame(std::move(frame));
            });
    }

    void onFrame(std::shared_ptr<const Frame> frame)
    {
        waiting = false;

        if (finished || closing)
        {
            return;
        }

        if (!frame)
        {
            closeAfterWrites();
            return;
        }

        writing = true;
        sending = std::move(frame);
        ws.async_write(boost::asio::buffer(sending->data),
                       [self = shared_from_this()](const beast::error_code& ec,
                                                   size_t) {
                           self->onWrite(ec);
                       });
    }

    void onWrite(const beast::error_code& ec)
    {
        writing = false;
        sending.reset();

        if (ec)
        {
            if (ec != boost::asio::error::operation_aborted)
            {
                log<level::DEBUG>("Web-socket write failed",
                                  entry("ERROR=%s", ec.message().c_str()));
            }
            finish();
            return;
        }

        if (closing)
        {
            sendClose();
            return;
        }

        waitFrame();
    }

    void closeAfterWrites()
    {
        if (closing || finished)
        {
            return;
        }
        closing = true;

        if (subscription)
        {
            subscription->close();
        }

        if (!connected)
        {
            finish();
            return;
        }

        if (!writing)
        {
            sendClose();
        }
    }

    void sendClose()
    {
        ws.async_close(websocket::close_code::going_away,
                       [self = shared_from_this()](const beast::error_code&) {
                           self->finish();
                       });
    }

    void finish()
    {
        if (finished)
        {
            return;
        }
        finished = true;

        if (subscription)
        {
            subscription->close();
        }

        if (connected)
        {
            input.disconnect();
            log<level::INFO>("Web-socket client disconnected",
                             entry("ADDRESS=%s", info.remoteAddress.c_str()));
        }

        beast::error_code ec;
        auto& socket = beast::get_lowest_layer(ws).socket();

        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    ConnectionInfo info;
    FrameHub& hub;
    InputSink& input;
    SessionValidator& validator;
    std::shared_ptr<Subscription> subscription;
    /* @brief Frame being written, kept alive until the write completes */
    std::shared_ptr<const Frame> sending;
    bool connected;
    bool waiting;
    bool writing;
    bool closing;
    bool finished;
};

} // namespace

bool routeInputMessage(std::span<const uint8_t> message, InputSink& sink)
{
    if (message.empty())
    {
        log<level::DEBUG>("Ignoring empty input message");
        return false;
    }

    auto payload = message.subspan(1);

    switch (message[0])
    {
        case keyboardTag:
            if (payload.size() == keyReportLength)
            {
                KeyboardReport report;

                std::copy(payload.begin(), payload.end(), report.begin());
                sink.sendKeyboard(report);
                return true;
            }
            break;
        case pointerTag:
            if (payload.size() == pointerReportLength)
            {
                PointerReport report;

                std::copy(payload.begin(), payload.end(), report.begin());
                sink.sendPointer(report);
                return true;
            }
            break;
        default:
            log<level::ERR>("Ignoring input message with unknown tag",
                            entry("TAG=%u", message[0]));
            return false;
    }

    log<level::ERR>("Ignoring input message of wrong length",
                    entry("TAG=%u", message[0]),
                    entry("LENGTH=%zu", payload.size()));
    return false;
}

WebSocketServer::WebSocketServer(boost::asio::io_context& io,
                                 const tcp::endpoint& endpoint, FrameHub& hub,
                                 InputSink& input,
                                 SessionValidator& validator) :
    io(io), acceptor(boost::asio::make_strand(io)), hub(hub), input(input),
    validator(validator)
{
    try
    {
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();
    }
    catch (const boost::system::system_error& e)
    {
        log<level::ERR>("Failed to listen for web-socket clients",
                        entry("ADDRESS=%s",
                              endpoint.address().to_string().c_str()),
                        entry("PORT=%u", endpoint.port()),
                        entry("ERROR=%s", e.what()));
        throw;
    }

    log<level::INFO>("Web-socket server listening", entry("PORT=%u", port()),
                     entry("PATH=%s", kvmPath));
}

void WebSocketServer::run()
{
    doAccept();
}

void WebSocketServer::stop()
{
    boost::asio::dispatch(acceptor.get_executor(), [this]() {
        boost::system::error_code ec;

        acceptor.close(ec);

        std::lock_guard<std::mutex> lk(lock);

        for (auto& weak : connections)
        {
            if (auto conn = weak.lock())
            {
                conn->stop();
            }
        }
        connections.clear();
    });
}

uint16_t WebSocketServer::port() const
{
    boost::system::error_code ec;

    return acceptor.local_endpoint(ec).port();
}

void WebSocketServer::doAccept()
{
    acceptor.async_accept(
        boost::asio::make_strand(io),
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec)
            {
                if (ec != boost::asio::error::operation_aborted)
                {
                    log<level::ERR>("Failed to accept web-socket client",
                                    entry("ERROR=%s", ec.message().c_str()));
                    doAccept();
                }
                return;
            }

            ConnectionInfo info{"websocket", "unknown", 0};
            boost::system::error_code epEc;
            auto remote = socket.remote_endpoint(epEc);

            if (!epEc)
            {
                info.remoteAddress = remote.address().to_string();
                info.remotePort = remote.port();
            }

            auto conn = std::make_shared<WebSocketConnection>(
                std::move(socket), info, hub, input, validator);

            {
                std::lock_guard<std::mutex> lk(lock);

                connections.remove_if([](const std::weak_ptr<Connection>& w) {
                    return w.expired();
                });
                connections.push_back(conn);
            }

            conn->start();
            doAccept();
        });
}

} // namespace kvm
