#include "Communication/channel/ControlChannel.hpp"
#include "Communication/transport/SocketTransport.hpp"
#include "Execution/AgentExecutor.hpp"
#include "System/Logger.hpp"
#include "Virtualization/snapshot/SnapshotManager.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"
#include "Virtualization/vm/VirtualMachinePool.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vmm/VirtualMachineFactory.hpp"
#include <boost/program_options.hpp>
#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

namespace {

NetworkMode parseNetworkMode(const std::string& value) {
    for (NetworkMode mode : {NetworkMode::NatFiltered, NetworkMode::Isolated, NetworkMode::Bridge}) {
        if (value == toString(mode)) return mode;
    }
    throw std::invalid_argument("unknown network mode '" + value + "' (nat-filtered, isolated, bridge)");
}

void printStats(const PoolStats& s) {
    std::cout << "pool: available=" << s.available << " checked_out=" << s.checkedOut << " pending=" << s.pending
              << " acquisitions=" << s.acquisitions
              << " avg_acquire_ms=" << std::chrono::duration_cast<std::chrono::milliseconds>(s.averageAcquireTime()).count()
              << " creation_failures=" << s.creationFailures << " reset_failures=" << s.resetFailures
              << " evictions=" << s.evictions << " destroyed=" << s.destroyed << std::endl;
}

int runCommand(VirtualMachine& vm, const std::string& command, std::uint32_t port,
               std::chrono::seconds execTimeout) {
    const auto cid = vm.vsockCid();
    if (!cid) {
        throw std::runtime_error("machine " + vm.name() + " has no vsock CID");
    }

    PROTOCOL::ControlChannel channel(SocketTransport::connectVsock(*cid, port));
    AgentExecutor executor;
    const ExecutionResult result = executor.execute(channel, command, execTimeout);

    std::cout << result.stdoutText;
    std::cerr << result.stderrText;
    std::cout << "exit code " << result.exitCode << " after " << result.duration.count() << "ms" << std::endl;
    return result.exitCode;
}

} // namespace

int main(int argc, char** argv) {
    po::options_description options("agenthive options");
    options.add_options()
        ("help,h", "Print this help message and exit")
        ("uri", po::value<std::string>()->default_value(HypervisorConnector::kDefaultUri), "libvirt connection URI")
        ("min-size", po::value<std::size_t>()->default_value(1), "Machines kept ready in the pool")
        ("max-size", po::value<std::size_t>()->default_value(3), "Upper bound on pooled machines")
        ("ttl", po::value<long>()->default_value(3600), "Machine lifetime in seconds")
        ("name-prefix", po::value<std::string>()->default_value("pool-vm"), "Prefix of generated domain names")
        ("disk", po::value<std::string>()->default_value(""), "qcow2 image per machine; {name} expands to the machine name. A fixed path requires --max-size 1")
        ("memory", po::value<unsigned long>()->default_value(2048), "Memory per machine in MiB")
        ("vcpus", po::value<unsigned int>()->default_value(2), "vCPUs per machine")
        ("network", po::value<std::string>()->default_value("nat-filtered"), "nat-filtered, isolated or bridge")
        ("acquire-timeout", po::value<long>()->default_value(60000), "Acquire wait in milliseconds")
        ("command,c", po::value<std::string>(), "Command to run in the acquired machine")
        ("exec-timeout", po::value<long>()->default_value(300), "Command timeout in seconds")
        ("vsock-port", po::value<std::uint32_t>()->default_value(SocketTransport::kDefaultVsockPort), "Guest agent vsock port")
        ("log-file", po::value<std::string>()->default_value("logs/agenthive.log"), "Rotating log file")
        ("no-log-file", "Log to the console only")
        ("verbose,v", "Debug output on the console");

    po::variables_map args;
    try {
        po::store(po::parse_command_line(argc, argv, options), args);
        po::notify(args);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << options << std::endl;
        return 2;
    }

    if (args.count("help")) {
        std::cout << options << std::endl;
        return 0;
    }

    LoggerConfig logConfig;
    logConfig.filePath = args["log-file"].as<std::string>();
    logConfig.enableFile = !args.count("no-log-file");
    if (args.count("verbose")) logConfig.consoleLevel = spdlog::level::debug;
    SafeLogger::initialize(logConfig);

    int exitCode = 0;
    try {
        PoolConfig config;
        config.minSize = args["min-size"].as<std::size_t>();
        config.maxSize = args["max-size"].as<std::size_t>();
        config.ttl = std::chrono::seconds(args["ttl"].as<long>());
        config.machine.namePrefix = args["name-prefix"].as<std::string>();
        config.machine.diskPath = args["disk"].as<std::string>();
        config.machine.memoryMiB = args["memory"].as<unsigned long>();
        config.machine.vcpus = args["vcpus"].as<unsigned int>();
        config.machine.network = parseNetworkMode(args["network"].as<std::string>());
        config.validate();

        auto connector = std::make_shared<HypervisorConnector>(args["uri"].as<std::string>());
        connector->connectOrThrow();

        VirtualMachinePool pool(config,
                                std::make_shared<VirtualMachineFactory>(connector),
                                std::make_shared<SnapshotManager>());
        const std::size_t ready = pool.initialize();
        AH_LOG_INFO("Pool ready with {} machine(s)", ready);

        auto machine = pool.acquire(std::chrono::milliseconds(args["acquire-timeout"].as<long>()));
        AH_LOG_INFO("Acquired {}", machine->name());

        if (args.count("command")) {
            auto* vm = dynamic_cast<VirtualMachine*>(machine->machine.get());
            if (!vm) throw std::logic_error("pooled machine is not a libvirt domain");
            try {
                exitCode = runCommand(*vm, args["command"].as<std::string>(),
                                      args["vsock-port"].as<std::uint32_t>(),
                                      std::chrono::seconds(args["exec-timeout"].as<long>()));
            } catch (const std::exception& e) {
                AH_LOG_ERROR("Command failed: {}", e.what());
                exitCode = 1;
            }
        }

        const auto outcome = pool.release(std::move(machine));
        AH_LOG_INFO("Machine released: {}", toString(outcome));

        printStats(pool.stats());
        pool.shutdown();
    } catch (const std::exception& e) {
        AH_LOG_CRITICAL("agenthive failed: {}", e.what());
        SafeLogger::reset();
        return 1;
    }

    SafeLogger::reset();
    return exitCode;
}
