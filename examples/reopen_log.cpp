/**
 * @file reopen_log.cpp
 * @brief Keeps appending to a log file and reopens it on a signal
 *
 * To see the effect:
 * - Run the program and watch log.txt grow.
 * - mv log.txt log2.txt: log2.txt keeps growing, it is still the open file.
 * - kill -HUP <pid>: log2.txt stops growing, a new log.txt appears and grows.
 */

#include <fdreopen/fdreopen.hpp>

#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <thread>

namespace po = boost::program_options;

namespace {

int signalByName(const std::string& name) {
    static const std::map<std::string, int> signals = {
        {"HUP", SIGHUP}, {"USR1", SIGUSR1}, {"USR2", SIGUSR2}};
    auto it = signals.find(name);
    return it == signals.end() ? 0 : it->second;
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Usage: reopen_log [options]");
    desc.add_options()
        ("help,h", "Print this help")
        ("file,f", po::value<std::string>()->default_value("log.txt"), "Log file to append to")
        ("interval-ms,i", po::value<int>()->default_value(1000), "Delay between two lines")
        ("signal,s", po::value<std::string>()->default_value("HUP"), "Reopen signal: HUP, USR1 or USR2")
        ("count,n", po::value<uint64_t>()->default_value(0), "Lines to write (0 = forever)")
        ("lock-writes", po::bool_switch(), "Take an fcntl lock around each line")
        ("log-level,l", po::value<std::string>()->default_value("info"), "Console log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << desc << "\n";
        return 2;
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    auto console = spdlog::stdout_color_mt("reopen_log");
    spdlog::set_default_logger(console);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%t] %l: %v");
    spdlog::set_level(spdlog::level::from_str(vm["log-level"].as<std::string>()));

    const std::string path = vm["file"].as<std::string>();
    const std::string signalName = vm["signal"].as<std::string>();
    const int signo = signalByName(signalName);
    if (signo == 0) {
        spdlog::error("unknown signal '{}'", signalName);
        return 2;
    }

    // 스레드를 만들기 전에 핸들러를 설치해 설치 중 시그널 유실 구간을 없앤다.
    std::error_code ec;
    FdReopen::Handle handle = FdReopen::Handle::stub();
    if (handle.registerSignal(signo, ec) == 0) {
        spdlog::error("cannot register SIG{}: {}", signalName, ec.message());
        return 1;
    }

    FdReopen::FdOpenOptions options = FdReopen::FdOpenOptions::append();
    options.lockWrites = vm["lock-writes"].as<bool>();
    auto logger = FdReopen::makeReopenLogger("file", path, handle, ec, options);
    if (!logger) {
        spdlog::error("cannot open {}: {}", path, ec.message());
        return 1;
    }
    logger->set_pattern("%v");
    logger->flush_on(spdlog::level::info);
    logger->set_error_handler(
        [](const std::string& msg) { spdlog::warn("{}; previous file kept", msg); });

    spdlog::info("writing to {} (pid {}), reopen with SIG{}", path, ::getpid(), signalName);

    const auto interval = std::chrono::milliseconds(vm["interval-ms"].as<int>());
    const uint64_t count = vm["count"].as<uint64_t>();
    for (uint64_t no = 1; count == 0 || no <= count; ++no) {
        std::this_thread::sleep_for(interval);
        if (handle.pending())
            spdlog::info("reopen requested, next line goes to a fresh {}", path);
        logger->info("Tick no {}", no);
    }

    spdlog::shutdown();
    return 0;
}
