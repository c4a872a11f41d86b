#include "kvm_server.hpp"

#include "kvm_rfb.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <phosphor-logging/log.hpp>

#include <array>
#include <deque>
#include <type_traits>
#include <vector>

namespace kvm
{

using namespace phosphor::logging;
using boost::asio::ip::tcp;

namespace
{

using TlsStream = boost::asio::ssl::stream<tcp::socket>;

constexpr size_t readChunk = 4096;

/*
 * @class RfbConnection
 * @brief Drives one RfbSession over a plain or TLS stream. Every handler runs
 *        on the strand the socket was accepted on.
 */
template <typename Stream>
class RfbConnection :
    public Connection,
    public std::enable_shared_from_this<RfbConnection<Stream>>
{
  public:
    RfbConnection(Stream&& s, const ConnectionInfo& i, FrameHub& h,
                  InputSink& in, SessionValidator& v) :
        stream(std::move(s)), info(i), hub(h), input(in), validator(v),
        session(h.geometry(), in, Server::desktopName), connected(false),
        waiting(false), frameInFlight(false), writing(false), closing(false),
        finished(false)
    {}

    void start() override
    {
        boost::asio::post(stream.get_executor(),
                          [self = this->shared_from_this()]() {
                              self->authorize();
                          });
    }

    void stop() override
    {
        boost::asio::post(stream.get_executor(),
                          [self = this->shared_from_this()]() {
                              self->closeAfterWrites();
                          });
    }

  private:
    struct Outgoing
    {
        std::vector<uint8_t> bytes;
        /* @brief Pixel data sent right after the bytes, may be null */
        std::shared_ptr<const Frame> frame;
    };

    void authorize()
    {
        if (!validator.authorize(info))
        {
            log<level::INFO>("RFB connection rejected",
                             entry("ADDRESS=%s", info.remoteAddress.c_str()));
            finish();
            return;
        }

        if constexpr (std::is_same_v<Stream, TlsStream>)
        {
            stream.async_handshake(
                boost::asio::ssl::stream_base::server,
                [self = this->shared_from_this()](
                    const boost::system::error_code& ec) {
                    if (ec)
                    {
                        log<level::ERR>(
                            "TLS handshake failed",
                            entry("ADDRESS=%s",
                                  self->info.remoteAddress.c_str()),
                            entry("ERROR=%s", ec.message().c_str()));
                        self->finish();
                        return;
                    }

                    self->begin();
                });
        }
        else
        {
            begin();
        }
    }

    void begin()
    {
        log<level::INFO>("RFB client connected",
                         entry("ADDRESS=%s", info.remoteAddress.c_str()),
                         entry("PORT=%u", info.remotePort));

        input.connect();
        connected = true;
        subscription = hub.subscribe(stream.get_executor());

        queue(Outgoing{RfbSession::greeting(), nullptr});
        doRead();
    }

    void doRead()
    {
        stream.async_read_some(
            boost::asio::buffer(chunk),
            [self = this->shared_from_this()](
                const boost::system::error_code& ec, size_t n) {
                self->onRead(ec, n);
            });
    }

    void onRead(const boost::system::error_code& ec, size_t n)
    {
        if (ec)
        {
            if (ec != boost::asio::error::eof &&
                ec != boost::asio::error::operation_aborted)
            {
                log<level::DEBUG>("RFB read failed",
                                  entry("ERROR=%s", ec.message().c_str()));
            }
            finish();
            return;
        }

        if (finished || closing)
        {
            return;
        }

        received.insert(received.end(), chunk.begin(), chunk.begin() + n);

        std::vector<uint8_t> replies;
        size_t used = session.consume(received, replies);

        received.erase(received.begin(), received.begin() + used);

        if (!replies.empty())
        {
            queue(Outgoing{std::move(replies), nullptr});
        }

        if (session.state() == RfbSession::State::closed)
        {
            log<level::INFO>("RFB protocol error, closing connection",
                             entry("ADDRESS=%s", info.remoteAddress.c_str()));
            closeAfterWrites();
            return;
        }

        maybeWaitFrame();
        doRead();
    }

    /* @brief At most one wait and one frame on the wire at a time */
    void maybeWaitFrame()
    {
        if (waiting || frameInFlight || closing || !subscription ||
            session.state() != RfbSession::State::running ||
            !session.updateRequested())
        {
            return;
        }

        waiting = true;
        subscription->asyncWait(
            [self = this->shared_from_this()](
                std::shared_ptr<const Frame> frame) {
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

        auto header = session.frameUpdateHeader(*frame);

        if (header.empty())
        {
            log<level::INFO>("RFB client cannot follow resize, closing",
                             entry("ADDRESS=%s", info.remoteAddress.c_str()),
                             entry("WIDTH=%zu", frame->width),
                             entry("HEIGHT=%zu", frame->height));
            closeAfterWrites();
            return;
        }

        frameInFlight = true;
        queue(Outgoing{std::move(header), std::move(frame)});
    }

    void queue(Outgoing&& out)
    {
        outgoing.push_back(std::move(out));
        doWrite();
    }

    void doWrite()
    {
        if (writing || outgoing.empty() || finished)
        {
            return;
        }

        writing = true;

        const Outgoing& front = outgoing.front();
        std::array<boost::asio::const_buffer, 2> buffers = {
            boost::asio::buffer(front.bytes),
            front.frame ? boost::asio::buffer(front.frame->data)
                        : boost::asio::const_buffer()};

        boost::asio::async_write(
            stream, buffers,
            [self = this->shared_from_this()](
                const boost::system::error_code& ec, size_t) {
                self->onWrite(ec);
            });
    }

    void onWrite(const boost::system::error_code& ec)
    {
        writing = false;

        if (ec)
        {
            if (ec != boost::asio::error::operation_aborted)
            {
                log<level::DEBUG>("RFB write failed",
                                  entry("ERROR=%s", ec.message().c_str()));
            }
            finish();
            return;
        }

        if (outgoing.front().frame)
        {
            frameInFlight = false;
        }
        outgoing.pop_front();

        if (closing && outgoing.empty())
        {
            finish();
            return;
        }

        doWrite();
        maybeWaitFrame();
    }

    void closeAfterWrites()
    {
        closing = true;

        if (subscription)
        {
            subscription->close();
        }

        if (!writing && outgoing.empty())
        {
            finish();
        }
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
            log<level::INFO>("RFB client disconnected",
                             entry("ADDRESS=%s", info.remoteAddress.c_str()));
        }

        boost::system::error_code ec;

        stream.lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
        stream.lowest_layer().close(ec);
    }

    Stream stream;
    ConnectionInfo info;
    FrameHub& hub;
    InputSink& input;
    SessionValidator& validator;
    RfbSession session;
    std::shared_ptr<Subscription> subscription;
    std::array<uint8_t, readChunk> chunk;
    std::vector<uint8_t> received;
    std::deque<Outgoing> outgoing;
    bool connected;
    bool waiting;
    bool frameInFlight;
    bool writing;
    bool closing;
    bool finished;
};

ConnectionInfo describe(const tcp::socket& socket)
{
    ConnectionInfo info{"rfb", "unknown", 0};
    boost::system::error_code ec;
    auto remote = socket.remote_endpoint(ec);

    if (!ec)
    {
        info.remoteAddress = remote.address().to_string();
        info.remotePort = remote.port();
    }

    return info;
}

} // namespace

Server::Server(boost::asio::io_context& io, const tcp::endpoint& endpoint,
               FrameHub& hub, InputSink& input, SessionValidator& validator,
               boost::asio::ssl::context* tls) :
    io(io), acceptor(boost::asio::make_strand(io)), hub(hub), input(input),
    validator(validator), tls(tls)
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
        log<level::ERR>("Failed to listen for RFB clients",
                        entry("ADDRESS=%s",
                              endpoint.address().to_string().c_str()),
                        entry("PORT=%u", endpoint.port()),
                        entry("ERROR=%s", e.what()));
        throw;
    }

    log<level::INFO>("RFB server listening", entry("PORT=%u", port()),
                     entry("TLS=%s", tls ? "yes" : "no"));
}

void Server::run()
{
    doAccept();
}

void Server::stop()
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

uint16_t Server::port() const
{
    boost::system::error_code ec;

    return acceptor.local_endpoint(ec).port();
}

void Server::doAccept()
{
    acceptor.async_accept(
        boost::asio::make_strand(io),
        [this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec)
            {
                if (ec != boost::asio::error::operation_aborted)
                {
                    log<level::ERR>("Failed to accept RFB client",
                                    entry("ERROR=%s", ec.message().c_str()));
                    doAccept();
                }
                return;
            }

            boost::system::error_code optEc;

            socket.set_option(tcp::no_delay(true), optEc);

            auto info = describe(socket);
            std::shared_ptr<Connection> conn;

            if (tls)
            {
                conn = std::make_shared<RfbConnection<TlsStream>>(
                    TlsStream(std::move(socket), *tls), info, hub, input,
                    validator);
            }
            else
            {
                conn = std::make_shared<RfbConnection<tcp::socket>>(
                    std::move(socket), info, hub, input, validator);
            }

            track(conn);
            conn->start();
            doAccept();
        });
}

void Server::track(const std::shared_ptr<Connection>& conn)
{
    std::lock_guard<std::mutex> lk(lock);

    connections.remove_if(
        [](const std::weak_ptr<Connection>& w) { return w.expired(); });
    connections.push_back(conn);
}

} // namespace kvm
