#include "application.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "net/file_server.hpp"
#include "net/http_server.hpp"
#include "net/middleware.hpp"
#include "transfer/downloader.hpp"
#include "transfer/progress_reporter.hpp"
#include "transfer/target_file.hpp"
#include "transfer/transfer_error.hpp"
#include "util/byte_utils.hpp"
#include "util/cancellation.hpp"
#include "util/signal_watcher.hpp"
#include "util/version.hpp"

int application::run(int argc, char** argv) {
    cli_options options;
    std::string error;
    if (!parse_cli_options(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n\n" << usage();
        return 1;
    }

    switch (options.command) {
    case command_kind::version:
        std::cout << full_version() << std::endl;
        return 0;
    case command_kind::help:
        std::cout << usage();
        return 0;
    case command_kind::client:
    case command_kind::server:
        break;
    }

    // Before any thread exists, so only the watcher thread receives them
    if (!signal_watcher::block_signals({SIGINT, SIGTERM})) {
        std::cerr << "Failed to block termination signals" << std::endl;
        return 1;
    }

    if (options.command == command_kind::client) {
        return run_client_mode(options.client);
    }
    return run_server_mode(options.server);
}

int application::run_client_mode(const client_options& options) {
    std::error_code ec;
    std::filesystem::create_directories(options.log_home, ec);
    if (ec) {
        std::cerr << "Failed to create log directory " << options.log_home << ": " << ec.message()
                  << std::endl;
        return 1;
    }

    auto log = stream_logger::open_file(options.log_file(), options.level);
    if (!log) {
        std::cerr << "Failed to open log file " << options.log_file() << std::endl;
        return 1;
    }

    cancellation_source cancel;
    signal_watcher watcher({SIGINT, SIGTERM}, [&cancel, &log](int signo) {
        std::cout << "\nReceived interrupt signal, stopping download..." << std::endl;
        log->warn("client", "received signal, cancelling", {{"signal", signo}});
        cancel.cancel();
    });

    const download_config& config = options.download;
    log->info("client", "starting download",
              {{"url", config.url},
               {"output", config.output_path},
               {"chunk_size", config.chunk_size},
               {"concurrency", config.max_concurrency},
               {"retry", config.retry_count},
               {"resume", config.enable_resume},
               {"auto_chunk", config.auto_chunk}});

    try {
        downloader client(config, cancel, *log);
        progress_reporter reporter([&client] { return client.get_progress(); }, std::cout, cancel);

        auto start = std::chrono::steady_clock::now();
        if (options.show_progress) {
            reporter.start();
        }
        client.download();
        reporter.stop();
        if (options.show_progress) {
            reporter.report_once();
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::uint64_t size = existing_file_size(config.output_path);
        std::string duration_text = byte_utils::format_duration(duration);
        std::string size_text = byte_utils::format_bytes(size);
        std::string speed_text = byte_utils::format_speed(size, duration);

        std::cout << "\n✓ Download completed! Duration: " << duration_text
                  << " File size: " << size_text << " Average speed: " << speed_text << std::endl;
        log->info("client", "Download completed",
                  {{"duration", duration_text},
                   {"file_size", size_text},
                   {"average_speed", speed_text}});
    } catch (const transfer_error& e) {
        if (e.cancelled()) {
            std::cerr << "\nDownload cancelled" << std::endl;
            log->warn("client", "download cancelled", {{"reason", e.what()}});
            return EXIT_CANCELLED;
        }
        std::cerr << "\nError: download failed: " << e.what() << std::endl;
        log->error("client", "download failed",
                   {{"kind", to_string(e.kind())}, {"error", e.what()}});
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << std::endl;
        log->error("client", "invalid configuration", {{"error", e.what()}});
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        log->error("client", "unexpected failure", {{"error", e.what()}});
        return 1;
    }
    return 0;
}

int application::run_server_mode(const server_config& config) {
    stream_logger log(std::cout, log_level::info);

    std::error_code ec;
    std::filesystem::path root = std::filesystem::absolute(config.root_dir, ec);
    if (!ec && !std::filesystem::exists(root, ec)) {
        std::filesystem::create_directories(root, ec);
        if (!ec) {
            log.info("server", "created directory", {{"path", root.string()}});
        }
    }
    if (ec) {
        log.error("server", "failed to create root directory",
                  {{"path", config.root_dir}, {"error", ec.message()}});
        return 1;
    }

    file_server files(root.string(), log);
    std::vector<http_middleware> middlewares;
    if (config.access_log) {
        middlewares.push_back(logging_middleware(log));
    }
    if (!config.auth_user.empty()) {
        middlewares.push_back(basic_auth_middleware(config.auth_user, config.auth_password));
    }
    http_handler handler =
        chain([&files](const http_request& req) { return files.handle(req); }, middlewares);

    http_server server(config.address, config.port, handler, log);
    if (!server.start()) {
        return 1;
    }
    log.info("server", "file server started",
             {{"port", server.port()}, {"root", files.root().string()}});

    signal_watcher watcher({SIGINT, SIGTERM}, nullptr);
    int signo = watcher.wait();
    log.info("server", "shutting down", {{"signal", signo}});
    server.stop();
    return 0;
}
