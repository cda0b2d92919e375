#include "app_service.hpp"
#include "../logging/log_helper.hpp"
#include <stdexcept>

namespace app_service {

std::atomic<AppService*> AppService::g_instance{nullptr};

AppService::AppService(const std::string& service_name)
    : service_name_(service_name) {
    statistics_.reset();
}

AppService::~AppService() {
    stop();
    restore_signal_handlers();
}

bool AppService::initialize(int argc, char** argv) {
    if (initialized_.load()) {
        return true;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_file_ = argv[++i];
        } else if (arg == "--stats-interval" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                stats_interval_seconds_ = std::stoi(value);
            } catch (const std::exception&) {
                LOG_ERROR_COMP("APP_SERVICE", "Invalid --stats-interval: " + value);
                return false;
            }
        } else if (arg == "--help") {
            print_usage();
            return false;
        } else {
            LOG_WARN_COMP("APP_SERVICE", "Ignoring unknown argument: " + arg);
        }
    }

    if (config_file_.empty()) {
        config_file_ = service_name_ + ".ini";
    }

    config_manager_ = std::make_unique<config::ProcessConfigManager>();
    if (!config_manager_->load_config(config_file_)) {
        LOG_ERROR_COMP("APP_SERVICE", "Failed to load configuration from " + config_file_);
        return false;
    }

    setup_logging();
    print_startup_banner();

    LOG_INFO_COMP("APP_SERVICE", "Service: " + service_name_);
    LOG_INFO_COMP("APP_SERVICE", "Config file: " + config_file_);

    if (!config_manager_->validate_config()) {
        for (const auto& error : config_manager_->get_validation_errors()) {
            LOG_WARN_COMP("APP_SERVICE", "Config: " + error);
        }
    }

    setup_signal_handlers();

    if (!configure_service()) {
        LOG_ERROR_COMP("APP_SERVICE", "Service configuration failed");
        return false;
    }

    initialized_.store(true);
    LOG_INFO_COMP("APP_SERVICE", "Service initialized successfully");
    return true;
}

int AppService::run() {
    if (!initialized_.load()) {
        LOG_ERROR_COMP("APP_SERVICE", "Service not initialized");
        return 1;
    }

    if (running_.load()) {
        LOG_INFO_COMP("APP_SERVICE", "Service already running");
        return 1;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_running_ = true;
    }
    stats_thread_ = std::thread(&AppService::stats_reporting_loop, this);

    running_.store(true);
    statistics_.start_time = std::chrono::system_clock::now();

    if (!start_service()) {
        LOG_ERROR_COMP("APP_SERVICE", "Failed to start service");
        exit_code_.store(1);
        stop();
        return exit_code_.load();
    }

    LOG_INFO_COMP("APP_SERVICE", "Service started successfully");

    while (!stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::system_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - statistics_.start_time);
        statistics_.uptime_seconds.store(uptime.count());
    }

    LOG_INFO_COMP("APP_SERVICE", "Stop requested, shutting down...");
    stop();
    return exit_code_.load();
}

void AppService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO_COMP("APP_SERVICE", "Stopping service...");

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_running_ = false;
    }
    stats_cv_.notify_all();
    if (stats_thread_.joinable()) {
        stats_thread_.join();
    }

    stop_service();

    print_shutdown_banner();
}

void AppService::request_stop(int exit_code) {
    // First requester decides the exit code
    if (!stop_requested_.exchange(true)) {
        exit_code_.store(exit_code);
    }
}

void AppService::setup_logging() {
    std::string level = config_manager_->get_string("logging", "level", "INFO");
    logging::initialize_logging(config_manager_->get_log_file(), logging::parse_log_level(level));
}

void AppService::setup_signal_handlers() {
    g_instance.store(this);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
}

void AppService::restore_signal_handlers() {
    AppService* expected = this;
    if (g_instance.compare_exchange_strong(expected, nullptr)) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
    }
}

void AppService::stats_reporting_loop() {
    std::unique_lock<std::mutex> lock(stats_mutex_);
    while (stats_running_) {
        stats_cv_.wait_for(lock, std::chrono::seconds(stats_interval_seconds_),
                           [this] { return !stats_running_; });
        if (!stats_running_) {
            break;
        }

        lock.unlock();
        print_service_stats();
        lock.lock();
    }
}

void AppService::signal_handler(int signal) {
    (void)signal;
    AppService* instance = g_instance.load();
    if (instance) {
        instance->request_stop(0);
    }
}

void AppService::print_usage() {
    LOG_INFO_COMP("APP_SERVICE", "Usage: " + service_name_ + " [options]");
    LOG_INFO_COMP("APP_SERVICE", "Options:");
    LOG_INFO_COMP("APP_SERVICE", "  --config <file>             Configuration file path (default " + service_name_ + ".ini)");
    LOG_INFO_COMP("APP_SERVICE", "  --stats-interval <seconds>  Statistics reporting interval");
    LOG_INFO_COMP("APP_SERVICE", "  --help                      Show this help message");
}

void AppService::print_startup_banner() {
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
    LOG_INFO_COMP("APP_SERVICE", "  " + service_name_ + " Service Starting");
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
}

void AppService::print_shutdown_banner() {
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
    LOG_INFO_COMP("APP_SERVICE", "  " + service_name_ + " Service Stopped");
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
}

} // namespace app_service
