#include "kvm_args.hpp"
#include "kvm_manager.hpp"

#include <phosphor-logging/log.hpp>
#include <sdbusplus/asio/connection.hpp>
#include <sdbusplus/asio/object_server.hpp>

#include <exception>
#include <memory>
#include <optional>

using namespace phosphor::logging;

int main(int argc, char* argv[])
{
    std::optional<kvm::Args> args;
    std::unique_ptr<kvm::Manager> manager;

    try
    {
        args.emplace(argc, argv);
        manager = std::make_unique<kvm::Manager>(*args);
    }
    catch (const std::exception& e)
    {
        log<level::ERR>("Failed to start KVM daemon",
                        entry("ERROR=%s", e.what()));
        return 1;
    }

    auto bus = std::make_shared<sdbusplus::asio::connection>(manager->io);
    sdbusplus::asio::object_server kvmServer(bus);

    auto interface = kvmServer.add_interface(
        "/xyz/openbmc_project/kvm", "xyz.openbmc_project.kvm_interface");

    interface->register_method("Screenshot", [&manager]() {
        return manager->screenshot();
    });

    interface->initialize();

    bus->request_name("xyz.openbmc_project.kvm_service");

    return manager->run();
}
