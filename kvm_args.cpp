#include "kvm_args.hpp"

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

#include <phosphor-logging/elog-errors.hpp>
#include <phosphor-logging/elog.hpp>
#include <phosphor-logging/log.hpp>
#include <xyz/openbmc_project/Common/error.hpp>

namespace kvm
{

using namespace phosphor::logging;
using namespace sdbusplus::xyz::openbmc_project::Common::Error;

Args::Args(int argc, char* argv[]) :
    frameRate(30), keyboardPath("/dev/hidg0"), pointerPath("/dev/hidg1"),
    videoPath("/dev/video0"), framebufferPath("/dev/fb0"),
    forceFramebuffer(false), wsPort(8443), rfbPort(5900), tls(false),
    address("0.0.0.0")
{
    int option;
    const char* opts = "v:F:bk:p:w:r:tc:K:a:f:h";
    struct option lopts[] = {
        {"videoDevice", 1, 0, 'v'}, {"framebuffer", 1, 0, 'F'},
        {"forceFramebuffer", 0, 0, 'b'}, {"keyboard", 1, 0, 'k'},
        {"mouse", 1, 0, 'p'},       {"wsPort", 1, 0, 'w'},
        {"rfbPort", 1, 0, 'r'},     {"tls", 0, 0, 't'},
        {"cert", 1, 0, 'c'},        {"key", 1, 0, 'K'},
        {"address", 1, 0, 'a'},     {"frameRate", 1, 0, 'f'},
        {"help", 0, 0, 'h'},        {0, 0, 0, 0}};

    // getopt keeps its position across calls
    optind = 1;

    while ((option = getopt_long(argc, argv, opts, lopts, NULL)) != -1)
    {
        switch (option)
        {
            case 'v':
                videoPath = std::string(optarg);
                break;
            case 'F':
                framebufferPath = std::string(optarg);
                break;
            case 'b':
                forceFramebuffer = true;
                break;
            case 'k':
                keyboardPath = std::string(optarg);
                break;
            case 'p':
                pointerPath = std::string(optarg);
                break;
            case 'w':
                wsPort = parsePort("wsPort", optarg);
                break;
            case 'r':
                rfbPort = parsePort("rfbPort", optarg);
                break;
            case 't':
                tls = true;
                break;
            case 'c':
                certPath = std::string(optarg);
                break;
            case 'K':
                keyPath = std::string(optarg);
                break;
            case 'a':
                address = std::string(optarg);
                break;
            case 'f':
                frameRate = (int)strtol(optarg, NULL, 0);
                if (frameRate < minFrameRate)
                    frameRate = minFrameRate;
                else if (frameRate > maxFrameRate)
                    frameRate = maxFrameRate;
                break;
            case 'h':
                printUsage();
                exit(0);
        }
    }

    if (address.empty())
    {
        log<level::ERR>("Bind address must not be empty");
        elog<InvalidArgument>(
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_NAME(
                "address"),
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_VALUE(""));
    }
}

uint16_t Args::parsePort(const char* name, const char* value)
{
    char* end = nullptr;
    long port = strtol(value, &end, 10);

    if (end == value || *end != '\0' || port < 1 || port > 65535)
    {
        log<level::ERR>("Invalid port", entry("OPTION=%s", name),
                        entry("VALUE=%s", value));
        elog<InvalidArgument>(
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_NAME(name),
            xyz::openbmc_project::Common::InvalidArgument::ARGUMENT_VALUE(
                value));
    }

    return static_cast<uint16_t>(port);
}

void Args::printUsage()
{
    fprintf(stderr, "OpenBMC KVM daemon\n");
    fprintf(stderr, "Usage: obmc-kvm [options]\n");
    fprintf(stderr, "-v device              V4L2 capture device\n");
    fprintf(stderr, "-F device              framebuffer used as fallback\n");
    fprintf(stderr, "-b                     use the framebuffer only\n");
    fprintf(stderr, "-k device              HID keyboard gadget device\n");
    fprintf(stderr, "-p device              HID mouse gadget device\n");
    fprintf(stderr, "-w port                web-socket listen port\n");
    fprintf(stderr, "-r port                RFB listen port\n");
    fprintf(stderr, "-t, --tls              run RFB over TLS\n");
    fprintf(stderr, "-c file                PEM certificate chain\n");
    fprintf(stderr, "-K file                PEM private key\n");
    fprintf(stderr, "-a address             address to listen on\n");
    fprintf(stderr, "-f frame rate          try this frame rate\n");
    fprintf(stderr, "-h, --help             show this message and exit\n");
}

} // namespace kvm
