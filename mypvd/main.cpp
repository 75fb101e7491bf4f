#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

#include <pthread.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <yaml-cpp/yaml.h>

#include "libmypv/config.hpp"
#include "libmypv/device.hpp"
#include "libmypv/logging.hpp"
#include "libmypv/modbus_context.hpp"
#include "libmypv/snapshot_json.hpp"

namespace args = boost::program_options;
using namespace std;

void logCriticalError(std::shared_ptr<boost::log::sources::severity_logger<mypv::Log::severity>>& log,
        const char* message)
{
    if (log != NULL)
        BOOST_LOG_SEV(*log, mypv::Log::critical) << message;
    else
        cerr << message << endl;
}

typedef enum {
    VALUES,
    REGISTERS,
    JSON
} OutputFormat;

void printSnapshot(const mypv::Device& device, const mypv::DeviceSnapshot& snapshot, OutputFormat format) {
    if (format == OutputFormat::JSON) {
        cout << mypv::snapshotToJson(snapshot, device.getRegisterMap()) << endl;
        return;
    }

    if (format == OutputFormat::REGISTERS) {
        const std::vector<uint16_t>& regs(snapshot.getRawRegisters());
        for(size_t i = 0; i < regs.size(); i++) {
            cout << (snapshot.getFirstRegister() + i) << ": 0x"
                << std::hex << std::setw(4) << std::setfill('0') << regs[i]
                << std::dec << std::setfill(' ') << " " << regs[i] << endl;
        }
        return;
    }

    for(const mypv::RegisterField& field: device.getRegisterMap().fields()) {
        const mypv::SnapshotValue* val = snapshot.get(field.mId);
        if (val == nullptr)
            continue;
        cout << field.mName << ": ";
        if (!val->mValid) {
            cout << "n/a" << endl;
            continue;
        }
        cout << val->mValue;
        if (field.mUnit[0] != '\0')
            cout << " " << field.mUnit;
        cout << endl;
    }
}

int main(int ac, char* av[]) {
    std::shared_ptr<boost::log::sources::severity_logger<mypv::Log::severity>> log;
    std::string configPath;
    try {
        args::options_description desc("Arguments");

        int logLevel;

        desc.add_options()
            ("help", "produce help message")
            ("loglevel,l", args::value<int>(&logLevel), "setup logging: 0 off, 1-6 sets loglevel, higher is more verbose")
            ("config,c", args::value<string>(&configPath)->required(), "path to configuration file")
            ("once", "read device once, print values and exit")
            ("dump-registers", "print raw register contents instead of decoded values")
            ("json", "print decoded values as JSON, one object per line")
        ;

        args::variables_map vm;
        args::store(args::parse_command_line(ac, av, desc), vm);

        if (vm.count("help")) {
            cout << desc << "\n";
            return EXIT_SUCCESS;
        }
        args::notify(vm);

        mypv::Log::severity level = mypv::Log::severity::info;
        bool logDisabled = false;
        if (vm.count("loglevel"))
            logDisabled = !mypv::Log::fromVerbosity(logLevel, level);

        mypv::Log::init_logging(level, logDisabled);
        // temporary logger used in main before classes are initalized
        log.reset(new boost::log::sources::severity_logger<mypv::Log::severity>());
        BOOST_LOG_SEV(*log, mypv::Log::info) << "mypvd is starting";

        mypv::DeviceConfig config(mypv::DeviceConfig::loadFile(configPath));
        OutputFormat format = OutputFormat::VALUES;
        if (vm.count("dump-registers"))
            format = OutputFormat::REGISTERS;
        else if (vm.count("json"))
            format = OutputFormat::JSON;

        mypv::ModbusFactory factory;
        std::shared_ptr<mypv::IModbusTransport> transport(factory.getTransport(config.mModbus));
        BOOST_LOG_SEV(*log, mypv::Log::info) << "Connecting to " << config.mModbus.getDescription();
        std::unique_ptr<mypv::Device> device(mypv::Device::connect(transport, config.mSession, config.mPoller));

        if (vm.count("once")) {
            mypv::DeviceSnapshotPtr snapshot(device->poll());
            printSnapshot(*device, *snapshot, format);
            return EXIT_SUCCESS;
        }

        // signals are handled by sigwait in main thread only
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        int exitCode = EXIT_SUCCESS;
        std::thread poller([&]() {
            try {
                device->run(
                    [&](const mypv::DeviceSnapshotPtr& snapshot) {
                        printSnapshot(*device, *snapshot, format);
                        if (format != OutputFormat::JSON)
                            cout << endl;
                    },
                    [&](mypv::ConnectionState oldState, mypv::ConnectionState newState) {
                        BOOST_LOG_SEV(*log, mypv::Log::info) << "Device connection " << oldState << " -> " << newState;
                    }
                );
            } catch (const std::exception& ex) {
                logCriticalError(log, ex.what());
                exitCode = EXIT_FAILURE;
                kill(getpid(), SIGTERM);
            }
        });

        int sig = 0;
        sigwait(&signals, &sig);
        BOOST_LOG_SEV(*log, mypv::Log::info) << "Got signal " << sig << ", exiting…";
        device->stop();
        poller.join();

        BOOST_LOG_SEV(*log, mypv::Log::info) << "mypvd stopped";
        return exitCode;
    } catch (const YAML::BadFile& ex) {
        if (configPath == "")
            configPath = boost::filesystem::current_path().native();
        std::string msg = "Failed to load configuration from "s + configPath;
        logCriticalError(log, msg.c_str());
    } catch (const std::exception& ex) {
        logCriticalError(log, ex.what());
    }
    return EXIT_FAILURE;
}
