#include "Application.hpp"

#include <unistd.h>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace ncf {

Application::Application(int argc, char** argv)
    : initialized_(false)
    , exit_requested_(false)
    , argc_(argc)
    , argv_(argv)
{
    parseArguments();
}

Application::~Application() {
    shutdown();
}

int Application::run(const std::atomic<bool>& running) {
    if (!initialized_) {
        initialize();
    }

    NCF_LOG_INFO("netcurfew running, press Ctrl+C to stop");
    while (running.load() && http_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!http_->is_running()) {
        NCF_LOG_ERROR("HTTP server stopped unexpectedly");
        return 1;
    }
    return 0;
}

void Application::loadConfig(const std::string& config_path) {
    if (!config_.loadFromFile(config_path)) {
        throw ConfigError("cannot read config file: " + config_path);
    }
}

void Application::initialize() {
    if (initialized_) return;

    initializeLogging();
    NCF_LOG_INFO("Initializing netcurfew v" << kVersion);

    if (geteuid() != 0) {
        NCF_LOG_WARN("Not running as root; sending raw frames needs CAP_NET_RAW");
    }

    initializeCore();
    initializeApi();

    initialized_ = true;
    NCF_LOG_INFO("netcurfew initialized");
}

void Application::shutdown() {
    if (!initialized_) return;

    NCF_LOG_INFO("Shutting down netcurfew");

    http_->stop();
    timer_->stop();
    control_->shutdown();

    initialized_ = false;
}

void Application::initializeLogging() {
    auto& log = Logger::instance();

    std::string level_str = config_.get("log.level", "info");
    log.setLevel(Logger::levelFromString(level_str));
    log.setConsoleOutput(config_.getBool("log.console", true));

    std::string log_file = config_.get("log.file");
    if (!log_file.empty() && !log.setFileOutput(log_file)) {
        NCF_LOG_WARN("Cannot open log file " << log_file);
    }
}

std::string Application::resolveInterface() const {
    std::string iface = config_.get("network.interface", "auto");
    if (iface.empty() || iface == "auto") {
        iface = PcapTransport::default_route_interface();
        if (iface.empty()) {
            throw ConfigError("network.interface is 'auto' but no default route was found");
        }
        NCF_LOG_INFO("Using interface " << iface << " (default route)");
    }
    return iface;
}

void Application::initializeCore() {
    NCF_LOG_DEBUG("Initializing core components");

    transport_ = std::make_shared<PcapTransport>(resolveInterface());
    transport_->open();

    InterfaceInfo info = transport_->interface_info();
    NCF_LOG_INFO("Interface " << info.name << ": " << ip_to_string(info.ip)
                 << " / " << mac_to_string(info.mac));

    directory_ = std::make_unique<DeviceDirectory>(
        transport_, config_.getMillis("scan.timeout_ms", 3000));

    SpoofTiming timing;
    timing.interval      = config_.getMillis("spoof.interval_ms", 1000);
    timing.backoff       = config_.getMillis("spoof.backoff_ms", 2000);
    timing.stop_timeout  = config_.getMillis("spoof.stop_timeout_ms", 5000);
    timing.restore_count = config_.getInt("spoof.restore_count", 5);
    if (timing.restore_count < 0) {
        throw ConfigError("spoof.restore_count: must not be negative");
    }
    engine_ = std::make_unique<SpoofEngine>(transport_, *directory_, timing);

    store_ = std::make_unique<StateStore>(config_.get("state.file", "netcurfew_state.json"));
    state_ = std::make_unique<AppState>(store_->load());
    NCF_LOG_INFO("Loaded " << state_->presets.size() << " presets from " << store_->path());

    timer_ = std::make_unique<DailyTimerScheduler>();
    scheduler_ = std::make_unique<PresetScheduler>(*state_, *engine_, *timer_);
    control_ = std::make_unique<ControlService>(*state_, *engine_, *scheduler_,
                                                *directory_, *store_);

    PresetTable presets;
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        presets = state_->presets;
    }
    scheduler_->reconfigure(presets);
    timer_->start();
    NCF_LOG_INFO("Scheduler started with " << timer_->size() << " triggers");
}

void Application::initializeApi() {
    router_ = std::make_unique<ApiRouter>(*control_);
    http_ = std::make_unique<HttpServer>(*router_);

    HttpServerConfig cfg;
    cfg.host = config_.get("api.host", "127.0.0.1");
    int port = config_.getInt("api.port", 8000);
    if (port <= 0 || port > 65535) {
        throw ConfigError("api.port: out of range: " + std::to_string(port));
    }
    cfg.port = static_cast<uint16_t>(port);

    if (!http_->initialize(cfg) || !http_->start()) {
        throw std::runtime_error("cannot start HTTP API on " + cfg.host + ":" + std::to_string(port));
    }
}

void Application::printUsage() const {
    std::cout
        << "netcurfew " << kVersion << " - scheduled network curfew for one LAN device\n\n"
        << "Usage: netcurfew [options]\n\n"
        << "Options:\n"
        << "  --config FILE      Load settings (key = value) from FILE\n"
        << "  --interface IF     Network interface (default: auto)\n"
        << "  --host ADDR        API bind address (default: 127.0.0.1)\n"
        << "  --port N           API port (default: 8000)\n"
        << "  --state FILE       Persisted state file (default: netcurfew_state.json)\n"
        << "  --log-level LEVEL  trace, debug, info, warn, error\n"
        << "  --log-file FILE    Also log to FILE\n"
        << "  --help             Show this help\n"
        << "  --version          Show version\n";
}

void Application::parseArguments() {
    // Flags that map straight onto a config key
    static const std::pair<const char*, const char*> kOverrides[] = {
        {"--interface", "network.interface"},
        {"--host",      "api.host"},
        {"--port",      "api.port"},
        {"--state",     "state.file"},
        {"--log-level", "log.level"},
        {"--log-file",  "log.file"},
    };

    // --config is applied first so command-line values win
    for (int i = 1; i < argc_; ++i) {
        std::string arg(argv_[i]);
        if (arg == "--config") {
            if (i + 1 >= argc_) throw ConfigError("--config needs a value");
            loadConfig(argv_[++i]);
        }
    }

    for (int i = 1; i < argc_; ++i) {
        std::string arg(argv_[i]);
        if (arg == "--help" || arg == "-h") {
            printUsage();
            exit_requested_ = true;
            return;
        }
        if (arg == "--version") {
            std::cout << "netcurfew " << kVersion << "\n";
            exit_requested_ = true;
            return;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }

        bool matched = false;
        for (const auto& [flag, key] : kOverrides) {
            if (arg == flag) {
                if (i + 1 >= argc_) throw ConfigError(arg + " needs a value");
                config_.set(key, argv_[++i]);
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw ConfigError("unknown option: " + arg + " (see --help)");
        }
    }
}

} // namespace ncf
