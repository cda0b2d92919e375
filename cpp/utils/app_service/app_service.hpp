#pragma once
#include <memory>
#include <string>
#include <atomic>
#include <thread>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <signal.h>
#include "../config/process_config_manager.hpp"

namespace app_service {

/**
 * Application Service Base Class
 *
 * Base class for long running processes that provides:
 * - Command line parsing (--config, --stats-interval, --help)
 * - Configuration and logging setup from the INI file
 * - SIGINT/SIGTERM handling that requests a stop
 * - Periodic statistics reporting
 */
class AppService {
public:
    explicit AppService(const std::string& service_name);
    virtual ~AppService();

    // Process lifecycle
    bool initialize(int argc, char** argv);

    // Blocks until a stop is requested, returns the process exit code
    int run();
    void stop();

    // Safe to call from any thread and from the signal handler
    void request_stop(int exit_code = 0);
    bool stop_requested() const { return stop_requested_.load(); }
    bool is_running() const { return running_.load(); }

    void set_config_file(const std::string& config_file) { config_file_ = config_file; }
    void set_stats_interval(int seconds) { stats_interval_seconds_ = seconds; }

    struct Statistics {
        std::atomic<uint64_t> uptime_seconds{0};
        std::chrono::system_clock::time_point start_time;

        void reset() {
            uptime_seconds.store(0);
            start_time = std::chrono::system_clock::now();
        }
    };

    const Statistics& get_statistics() const { return statistics_; }

protected:
    virtual bool configure_service() = 0;
    virtual bool start_service() = 0;
    virtual void stop_service() = 0;
    virtual void print_service_stats() = 0;

    config::ProcessConfigManager* get_config_manager() { return config_manager_.get(); }
    const std::string& get_service_name() const { return service_name_; }
    const std::string& get_config_file() const { return config_file_; }

private:
    std::string service_name_;
    std::string config_file_;
    int stats_interval_seconds_{30};

    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> exit_code_{0};

    std::unique_ptr<config::ProcessConfigManager> config_manager_;
    std::thread stats_thread_;
    std::mutex stats_mutex_;
    std::condition_variable stats_cv_;
    bool stats_running_{false};

    Statistics statistics_;

    void setup_logging();
    void setup_signal_handlers();
    void restore_signal_handlers();
    void stats_reporting_loop();
    void print_usage();
    void print_startup_banner();
    void print_shutdown_banner();

    static std::atomic<AppService*> g_instance;
    static void signal_handler(int signal);
};

} // namespace app_service
