#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <csignal>
#include <chrono>
#include <filesystem>
#include <curl/curl.h>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/StopSource.hpp"
#include "supervisor/UploadSupervisor.hpp"
#include "upload/ApiUploadClient.hpp"
#include "upload/ProgressBoard.hpp"
#include "util/Log.hpp"
#include "watch/DirectoryWatcher.hpp"
#include "watch/VideoEventSource.hpp"
#include "workflow/UploadWorkflow.hpp"

using namespace reeldrop;

namespace {
    constexpr int kExitOk = 0;
    constexpr int kExitWatchFailure = 1;
    constexpr int kExitBadConfig = 2;
    constexpr int kExitAuthFailure = 3;

    void renderProgress(boost::asio::steady_timer& timer, ProgressBoard& board) {
        timer.expires_after(std::chrono::seconds(2));
        timer.async_wait([&timer, &board](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            for (const auto& line : board.snapshot()) {
                log::info(line);
            }
            renderProgress(timer, board);
        });
    }
}

int main(int argc, char* argv[])
{
    Config config;
    try {
        config = Config::load(argc > 1 ? argv[1] : "");
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return kExitBadConfig;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.watch.directory, ec);
    if (ec) {
        log::error("Cannot create " + config.watch.directory + ": " + ec.message());
        return kExitWatchFailure;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    boost::asio::io_context io_context;
    boost::asio::thread_pool workers(config.workerThreads);
    StopSource stop;
    ProgressBoard board;

    ApiUploadClient client(config, &stop);

    WorkflowOptions options;
    options.categoryId = config.categoryId;
    options.transferRetries = config.transferRetries;
    options.settleDelay = std::chrono::milliseconds(config.settleMillis);
    UploadWorkflow workflow(client, options, &board, &stop);

    UploadSupervisor supervisor(
        workers.get_executor(),
        [&workflow](const std::string& path) { return workflow.run(path); },
        config.concurrencyLimit());

    int exitCode = kExitOk;
    supervisor.setFatalHandler([&io_context, &exitCode](const FileTask& task) {
        boost::asio::post(io_context, [&io_context, &exitCode, task]() {
            log::error("Authentication rejected while uploading " + task.path + ": " + task.errorDetail +
                       "; stopping");
            exitCode = kExitAuthFailure;
            io_context.stop();
        });
    });

    int status = kExitOk;
    try {
        DirectoryWatcher watcher(io_context, config.watch.directory);
        VideoEventSource source(config.watch, [&supervisor](const std::string& path) {
            return supervisor.admit(path);
        });
        watcher.subscribe([&source](const FileEvent& event) { source.onEvent(event); });

        boost::asio::steady_timer progressTimer(io_context);
        renderProgress(progressTimer, board);

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& error, int signum) {
            if (error) {
                return;
            }
            log::info("Signal " + std::to_string(signum) + " received, shutting down");
            watcher.stop();
            progressTimer.cancel();
            io_context.stop();
        });

        log::info("Monitoring " + config.watch.directory + " for new *" + config.watch.suffix + " files...");
        io_context.run();
        status = exitCode;
    } catch (const WatchError& e) {
        log::error("Watch failed: " + std::string(e.what()));
        status = kExitWatchFailure;
    }

    supervisor.close();
    stop.requestStop();
    if (!supervisor.waitIdle(std::chrono::seconds(config.shutdownGraceSeconds))) {
        for (const auto& path : supervisor.inFlightPaths()) {
            log::warn("Abandoning incomplete upload of " + path + " (file left in place)");
        }
        stop.abort();
    }
    workers.join();

    curl_global_cleanup();
    return status;
}
