/**
 * @file main.cpp
 * @brief stillhere_server: HTTP API plus expiry poller over one in-memory registry
 *
 * Usage: stillhere_server [config.json]
 */

#include "stillhere/bootstrap.hpp"
#include "stillhere/config.hpp"
#include "stillhere/http.hpp"
#include "stillhere/identity.hpp"
#include "stillhere/logger.hpp"

#include <csignal>
#include <iostream>
#include <thread>

#include <pthread.h>

namespace {

bool configure_logging(const stillhere::Config& config) {
    auto& logger = stillhere::Logger::instance();
    if (!config.log_file.empty() && !logger.init_file(config.log_file)) {
        std::cerr << "cannot open log file " << config.log_file << "\n";
        return false;
    }
    logger.set_level(stillhere::effective_log_level(config));
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    stillhere::Config config;
    if (argc > 1) {
        auto loaded = stillhere::load_config(argv[1]);
        if (loaded.is_error()) {
            std::cerr << stillhere::error_code_to_string(loaded.error_code()) << ": "
                      << loaded.error_message() << "\n";
            return 1;
        }
        config = std::move(loaded).value();
    }
    stillhere::apply_env_overrides(config);

    if (!configure_logging(config)) {
        return 1;
    }

    // Block SIGINT/SIGTERM in every thread; a dedicated thread waits for them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    stillhere::Bootstrap bootstrap;

    stillhere::PollerOptions options;
    options.interval_seconds = config.poll_interval_seconds;
    options.consumer_id =
        config.consumer_id.empty() ? stillhere::identity::generate_consumer_id() : config.consumer_id;
    auto poller = bootstrap.make_poller(options);

    stillhere::http::Router router(bootstrap);
    stillhere::http::HttpServer server(router, config.host, config.port);

    std::thread signal_thread([&signals, &server]() {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            STILLHERE_LOG_INFO("received signal {}, shutting down", received);
        }
        server.stop();
    });

    STILLHERE_LOG_INFO("stillhere {} starting on {} (consumer {})", stillhere::VERSION,
                       stillhere::identity::get_hostname(), poller->consumer_id());
    poller->start();

    bool ok = server.listen();

    poller->stop();
    if (!ok) {
        // Release the signal thread when listen() failed before any signal arrived
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();

    STILLHERE_LOG_INFO("stillhere stopped");
    return ok ? 0 : 1;
}
