#ifndef NCF_APPLICATION_HPP
#define NCF_APPLICATION_HPP

#include <atomic>
#include <memory>
#include <string>

#include "core/include/ncf_api_router.hpp"
#include "core/include/ncf_app_state.hpp"
#include "core/include/ncf_config.hpp"
#include "core/include/ncf_control.hpp"
#include "core/include/ncf_device_directory.hpp"
#include "core/include/ncf_http_server.hpp"
#include "core/include/ncf_link_transport.hpp"
#include "core/include/ncf_logger.hpp"
#include "core/include/ncf_preset_scheduler.hpp"
#include "core/include/ncf_spoof_engine.hpp"
#include "core/include/ncf_state_store.hpp"
#include "core/include/ncf_timer_scheduler.hpp"

namespace ncf {

/**
 * @brief Process orchestrator for netcurfew
 *
 * Parses the command line, loads settings and persisted state, wires the
 * control plane together and owns every component for the process
 * lifetime.
 */
class Application {
public:
    static constexpr const char* kVersion = "1.0.0";

    Application(int argc, char** argv);
    ~Application();

    // Prevent copying
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /// True when --help or --version was handled and the process should exit
    bool exitRequested() const { return exit_requested_; }

    // Lifecycle management
    void initialize();
    int run(const std::atomic<bool>& running);
    void shutdown();

    bool isInitialized() const { return initialized_; }

    Config& config() { return config_; }
    Logger& logger() { return Logger::instance(); }

private:
    // Settings
    Config config_;
    bool initialized_;
    bool exit_requested_;
    int argc_;
    char** argv_;

    // Core components
    std::shared_ptr<PcapTransport>       transport_;
    std::unique_ptr<DeviceDirectory>     directory_;
    std::unique_ptr<SpoofEngine>         engine_;
    std::unique_ptr<StateStore>          store_;
    std::unique_ptr<AppState>            state_;
    std::unique_ptr<PresetScheduler>     scheduler_;
    std::unique_ptr<ControlService>      control_;
    // Destroyed before the scheduler its callbacks call into
    std::unique_ptr<DailyTimerScheduler> timer_;
    std::unique_ptr<ApiRouter>           router_;
    std::unique_ptr<HttpServer>          http_;

    // Private initialization helpers
    void parseArguments();
    void loadConfig(const std::string& config_path);
    void initializeLogging();
    void initializeCore();
    void initializeApi();
    void printUsage() const;
    std::string resolveInterface() const;
};

} // namespace ncf

#endif // NCF_APPLICATION_HPP
