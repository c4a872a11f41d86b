#include "kvm_manager.hpp"

#include "kvm_certificate.hpp"
#include "kvm_pixel.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <phosphor-logging/elog-errors.hpp>
#include <phosphor-logging/elog.hpp>
#include <phosphor-logging/log.hpp>
#include <xyz/openbmc_project/Common/Device/error.hpp>
#include <xyz/openbmc_project/Common/error.hpp>

#include <algorithm>
#include <thread>
#include <vector>

namespace kvm
{

using namespace phosphor::logging;
using namespace sdbusplus::xyz::openbmc_project::Common::Error;
using sdbusplus::xyz::openbmc_project::Common::Device::Error::ReadFailure;
using boost::asio::ip::tcp;

namespace
{

/* @brief Poll interval of the capture loop while nobody is watching */
constexpr auto idleInterval = std::chrono::milliseconds(100);
constexpr auto drainTimeout = std::chrono::seconds(2);

SourceOptions sourceOptions(const Args& args)
{
    SourceOptions options;

    options.videoPath = args.getVideoPath();
    options.framebufferPath = args.getFramebufferPath();
    options.forceFramebuffer = args.getForceFramebuffer();
    options.frameRate = args.getFrameRate();

    return options;
}

tcp::endpoint endpointFor(const Args& args, uint16_t port)
{
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(args.getAddress(), ec);

    if (ec)
    {
        log<level::ERR>("Invalid bind address",
                        entry("ADDRESS=%s", args.getAddress().c_str()));
        elog<InvalidArgument>(
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_NAME(
                "address"),
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_VALUE(
                args.getAddress().c_str()));
    }

    return tcp::endpoint(address, port);
}

} // namespace

Manager::Manager(const Args& args) :
    period(std::chrono::microseconds(1000000 / args.getFrameRate())),
    video(selectSource(sourceOptions(args))), hub(video.geometry()),
    input(args.getKeyboardPath(), args.getPointerPath(),
          blocking.get_executor()),
    tls(makeTls(args)),
    rfbServer(io, endpointFor(args, args.getRfbPort()), hub, input, validator,
              tls ? &*tls : nullptr),
    wsServer(io, endpointFor(args, args.getWebSocketPort()), hub, input,
             validator),
    signals(io, SIGINT, SIGTERM), drainTimer(io), continueExecuting(true),
    captureFailed(false), shotFlag(false)
{}

std::optional<boost::asio::ssl::context> Manager::makeTls(const Args& args)
{
    if (!args.getTls())
    {
        if (!args.getCertPath().empty() || !args.getKeyPath().empty())
        {
            log<level::WARNING>("Certificate given without --tls, ignoring");
        }
        return std::nullopt;
    }

    return makeServerContext(loadOrGenerate(
        args.getCertPath(), args.getKeyPath(), args.getAddress()));
}

int Manager::run()
{
    signals.async_wait([this](const boost::system::error_code& ec, int sig) {
        if (!ec)
        {
            log<level::INFO>("Shutting down", entry("SIGNAL=%d", sig));
            shutdown();
        }
    });

    rfbServer.run();
    wsServer.run();

    std::thread capture(&Manager::captureLoop, this);
    std::vector<std::thread> workers;
    unsigned int threads = std::max(1u, std::thread::hardware_concurrency());

    for (unsigned int i = 1; i < threads; ++i)
    {
        workers.emplace_back([this]() { io.run(); });
    }

    io.run();

    for (auto& worker : workers)
    {
        worker.join();
    }

    {
        std::lock_guard<std::mutex> lk(lock);
        continueExecuting = false;
    }
    sync.notify_all();
    capture.join();

    blocking.join();
    video.close();

    return captureFailed ? 1 : 0;
}

std::string Manager::screenshot()
{
    if (captureFailed)
    {
        return "No frame";
    }

    bool expected = false;

    if (!shotFlag.compare_exchange_strong(expected, true))
    {
        return "Screenshot busy";
    }

    sync.notify_all();

    return screenshotPath;
}

void Manager::shutdown()
{
    {
        std::lock_guard<std::mutex> lk(lock);

        if (!continueExecuting)
        {
            return;
        }
        continueExecuting = false;
    }
    sync.notify_all();

    boost::system::error_code ec;

    signals.cancel(ec);
    hub.shutdown();
    rfbServer.stop();
    wsServer.stop();

    // the D-Bus connection never runs out of work, so stop explicitly once
    // sessions had a chance to flush
    drainTimer.expires_after(drainTimeout);
    drainTimer.async_wait([this](const boost::system::error_code&) {
        io.stop();
    });
}

void Manager::captureLoop()
{
    while (continueExecuting)
    {
        if (hub.subscriberCount() == 0 && !shotFlag)
        {
            idleUntil(std::chrono::steady_clock::now() + idleInterval);
            continue;
        }

        auto deadline = std::chrono::steady_clock::now() + period;

        try
        {
            hub.publish(video.nextFrame());
        }
        catch (const ReadFailure& e)
        {
            log<level::ERR>("Video capture failed, exiting",
                            entry("ERROR=%s", e.what()));
            captureFailed = true;
            shotFlag = false;
            boost::asio::post(io, [this]() { shutdown(); });
            return;
        }

        takeScreenshot();
        idleUntil(deadline);
    }
}

void Manager::takeScreenshot()
{
    if (!shotFlag)
    {
        return;
    }

    auto frame = hub.current();

    if (frame && writeJpeg(*frame, screenshotPath))
    {
        log<level::INFO>("Screenshot written",
                         entry("PATH=%s", screenshotPath));
    }

    shotFlag = false;
}

void Manager::idleUntil(std::chrono::steady_clock::time_point deadline)
{
    std::unique_lock<std::mutex> ulock(lock);

    sync.wait_until(ulock, deadline, [this]() {
        return !continueExecuting || shotFlag;
    });
}

} // namespace kvm
