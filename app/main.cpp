// main.cpp — peersyncd: демон синхронизации буфера, уведомлений и файлов

#include "peersync/SyncService.h"
#include "peersync/Config.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <boost/program_options.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

namespace po = boost::program_options;

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
    g_stopRequested = true;
}

void setupLogging(const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false));
    }

    auto logger = std::make_shared<spdlog::logger>("peersync", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("peersyncd options");
    desc.add_options()
        ("help,h", "show this help")
        ("port,p", po::value<uint16_t>(), "TCP port (default from config.json, 8765)")
        ("app-dir", po::value<std::string>(), "application directory (default ~/.config/peersync)")
        ("config,c", po::value<std::string>(), "path to config.json")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error")
        ("log-file", po::value<std::string>(), "also write log to this file")
        ("debug,d", "same as --log-level debug")
        ("no-clipboard", "disable clipboard monitoring")
        ("no-notifications", "disable notification capture");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "peersyncd: " << e.what() << "\n\n" << desc << "\n";
        return 2;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    try {
        setupLogging(vm.count("log-file") ? vm["log-file"].as<std::string>() : std::string());
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "peersyncd: cannot set up logging: " << e.what() << "\n";
        return 1;
    }

    std::string cliLevel;
    if (vm.count("debug")) {
        cliLevel = "debug";
    } else if (vm.count("log-level")) {
        cliLevel = vm["log-level"].as<std::string>();
    }
    if (!cliLevel.empty()) {
        spdlog::set_level(spdlog::level::from_str(cliLevel));
    }

    PeerSync::SyncOptions options;
    if (vm.count("app-dir")) options.appDir = vm["app-dir"].as<std::string>();
    if (vm.count("config")) options.configPath = vm["config"].as<std::string>();
    if (vm.count("port")) options.port = vm["port"].as<uint16_t>();
    options.enableClipboard = !vm.count("no-clipboard");
    options.enableNotifications = !vm.count("no-notifications");

    PeerSync::SyncService service(options);
    if (!service.start()) {
        spdlog::critical("peersyncd: {}", service.getLastError());
        return 1;
    }

    // Уровень из config.json, если не задан флагами
    if (cliLevel.empty()) {
        spdlog::set_level(spdlog::level::from_str(service.config()->get().logLevel));
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    std::cout << "PeerSync listening on port " << service.getPort()
              << ", pairing code: " << service.getPairingCode() << std::endl;

    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("peersyncd: Shutting down");
    service.stop();
    spdlog::shutdown();
    return 0;
}
