// Runtime
#include "runtime/Manager.hpp"

// Database
#include "db/Transactions.hpp"
#include "db/Schema.hpp"
#include "db/adapter/PgJobStore.hpp"
#include "db/adapter/PgFileCatalog.hpp"

// Preview
#include "preview/Scheduler.hpp"
#include "preview/GotenbergConverter.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <curl/curl.h>
#include <fmt/core.h>
#include <string>
#include <string_view>
#include <thread>

using namespace ds;
using namespace ds::config;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }

// Accepts `--config <path>` or `--config=<path>`; returns false on anything else.
bool parseArgs(const int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) paths::setConfigPath(argv[++i]);
        else if (arg.starts_with("--config=")) paths::setConfigPath(std::string(arg.substr(9)));
        else return false;
    }
    return true;
}
}

int main(int argc, char** argv) {
    if (!parseArgs(argc, argv)) {
        fmt::print(stderr, "usage: {} [--config <path>]\n", argv[0]);
        return EXIT_FAILURE;
    }

    try {
        ConfigRegistry::init(paths::getConfigPath());
        log::Registry::init();

        const auto& cfg = ConfigRegistry::get();

        log::Registry::docshare()->info("[*] Initializing docshare preview daemon...");

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");

        db::Transactions::init(cfg.database);
        db::schema::initTablesIfNotExists();
        db::Transactions::dbPool_->initPreparedStatements();

        auto queue = std::make_shared<preview::Scheduler::Queue>(cfg.preview.queue_buffer_size);
        auto scheduler = std::make_shared<preview::Scheduler>(
            std::make_shared<db::adapter::PgJobStore>(),
            std::make_shared<db::adapter::PgFileCatalog>(),
            std::make_shared<preview::GotenbergConverter>(cfg.gotenberg, cfg.storage),
            queue,
            cfg.preview);

        {
            runtime::Manager manager(scheduler);
            manager.startAll();

            log::Registry::docshare()->info("[✓] Preview daemon started (queue capacity {}, {} worker(s), gotenberg {})",
                                            queue->capacity(), scheduler->workerCount(), cfg.gotenberg.url);

            std::signal(SIGINT, signalHandler);
            std::signal(SIGTERM, signalHandler);

            while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

            log::Registry::docshare()->info("[*] Signal received, shutting down preview daemon...");
            manager.stopAll();
        }

        scheduler.reset();
        db::Transactions::shutdown();
        curl_global_cleanup();

        log::Registry::docshare()->info("[✓] Preview daemon shut down cleanly.");
        log::Registry::shutdown();

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized())
            log::Registry::docshare()->error("[-] Preview daemon failed: {}", e.what());
        else
            fmt::print(stderr, "[-] Preview daemon failed: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
