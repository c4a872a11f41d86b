#pragma once

#include <cstdint>
#include <string>

namespace kvm
{

/*
 * @struct ConnectionInfo
 * @brief What is known about a client before it speaks
 */
struct ConnectionInfo
{
    /* @brief "rfb" or "websocket" */
    std::string protocol;
    std::string remoteAddress;
    uint16_t remotePort;
};

/*
 * @class SessionValidator
 * @brief Decides whether a new connection may proceed
 */
class SessionValidator
{
  public:
    virtual ~SessionValidator() = default;

    virtual bool authorize(const ConnectionInfo& info) = 0;
};

/*
 * @class Connection
 * @brief A client connection its listener can stop
 */
class Connection
{
  public:
    virtual ~Connection() = default;

    virtual void start() = 0;
    /* @brief Closes the connection once queued bytes are written */
    virtual void stop() = 0;
};

/* @brief Lets every connection through */
class AllowAllValidator : public SessionValidator
{
  public:
    bool authorize(const ConnectionInfo&) override
    {
        return true;
    }
};

} // namespace kvm
