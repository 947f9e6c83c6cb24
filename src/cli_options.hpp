#pragma once

#include <string>

#include "net/file_server.hpp"
#include "transfer/download_config.hpp"
#include "util/logger.hpp"

enum class command_kind {
    help,
    version,
    client,
    server,
};

struct client_options {
    download_config download;
    bool show_progress = true;
    std::string log_home = "./logs";
    log_level level = log_level::debug;

    client_options();

    std::string log_file() const {
        return log_home + "/client.log";
    }
};

struct cli_options {
    command_kind command = command_kind::help;
    client_options client;
    server_config server;
};

// Parses `ezft [client|server] [flags]`. Returns false and sets `error` on an
// unknown command, unknown flag, missing required flag or malformed value.
bool parse_cli_options(int argc, char** argv, cli_options& out, std::string& error);

std::string usage();

// "down/<last URL path segment>"
std::string default_output_path(const std::string& url);
