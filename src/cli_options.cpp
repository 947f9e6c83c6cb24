#include "cli_options.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <getopt.h>
#include <limits>

namespace {
constexpr const char* DEFAULT_DOWNLOAD_DIR = "down/";
constexpr const char* FALLBACK_FILE_NAME = "download";

enum client_flag {
    FLAG_RESUME = 1000,
    FLAG_AUTO_CHUNK,
    FLAG_LOG_HOME,
    FLAG_LOG_LEVEL,
};

enum server_flag {
    FLAG_AUTH = 2000,
};

bool parse_unsigned(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), ::isdigit)) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool parse_int(const std::string& text, int& out) {
    std::uint64_t value = 0;
    if (!parse_unsigned(text, value) ||
        value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

// A missing value means true: `--resume` and `--resume=true` are the same.
bool parse_flag_value(const char* arg, bool& out) {
    if (arg == nullptr) {
        out = true;
        return true;
    }
    std::string value = arg;
    if (!value.empty() && value.front() == '=') {
        value.erase(0, 1);
    }
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    if (value == "true" || value == "1" || value.empty()) {
        out = true;
    } else if (value == "false" || value == "0") {
        out = false;
    } else {
        return false;
    }
    return true;
}

std::string describe_bad_option(int argc, char** argv) {
    int index = optind - 1;
    if (index >= 0 && index < argc) {
        return std::string("invalid option: ") + argv[index];
    }
    return "invalid option";
}

bool parse_client(int argc, char** argv, client_options& out, std::string& error) {
    static const option long_options[] = {
        {"url", required_argument, nullptr, 'u'},
        {"output", required_argument, nullptr, 'o'},
        {"chunk-size", required_argument, nullptr, 's'},
        {"concurrency", required_argument, nullptr, 'c'},
        {"retry", required_argument, nullptr, 'r'},
        {"resume", optional_argument, nullptr, FLAG_RESUME},
        {"auto-chunk", optional_argument, nullptr, FLAG_AUTO_CHUNK},
        {"progress", optional_argument, nullptr, 'p'},
        {"log-home", required_argument, nullptr, FLAG_LOG_HOME},
        {"log-level", required_argument, nullptr, FLAG_LOG_LEVEL},
        {nullptr, 0, nullptr, 0},
    };

    download_config& config = out.download;
    int opt;
    while ((opt = getopt_long(argc, argv, ":u:o:s:c:r:p::", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'u':
            config.url = optarg;
            break;
        case 'o':
            config.output_path = optarg;
            break;
        case 's':
            if (!parse_unsigned(optarg, config.chunk_size) || config.chunk_size == 0) {
                error = std::string("invalid chunk size: ") + optarg;
                return false;
            }
            break;
        case 'c':
            if (!parse_int(optarg, config.max_concurrency) || config.max_concurrency < 1) {
                error = std::string("invalid concurrency: ") + optarg;
                return false;
            }
            break;
        case 'r':
            if (!parse_int(optarg, config.retry_count)) {
                error = std::string("invalid retry count: ") + optarg;
                return false;
            }
            break;
        case FLAG_RESUME:
            if (!parse_flag_value(optarg, config.enable_resume)) {
                error = std::string("invalid value for --resume: ") + optarg;
                return false;
            }
            break;
        case FLAG_AUTO_CHUNK:
            if (!parse_flag_value(optarg, config.auto_chunk)) {
                error = std::string("invalid value for --auto-chunk: ") + optarg;
                return false;
            }
            break;
        case 'p':
            if (!parse_flag_value(optarg, out.show_progress)) {
                error = std::string("invalid value for --progress: ") + optarg;
                return false;
            }
            break;
        case FLAG_LOG_HOME:
            out.log_home = optarg;
            break;
        case FLAG_LOG_LEVEL:
            if (!parse_log_level(optarg, out.level)) {
                error = std::string("invalid log level: ") + optarg;
                return false;
            }
            break;
        case ':':
            error = std::string("missing value for ") + argv[optind - 1];
            return false;
        default:
            error = describe_bad_option(argc, argv);
            return false;
        }
    }

    if (optind < argc) {
        error = std::string("unexpected argument: ") + argv[optind];
        return false;
    }
    if (config.url.empty()) {
        error = "required flag \"url\" not set";
        return false;
    }
    if (config.output_path.empty()) {
        config.output_path = default_output_path(config.url);
    }
    return true;
}

bool parse_server(int argc, char** argv, server_config& out, std::string& error) {
    static const option long_options[] = {
        {"dir", required_argument, nullptr, 'd'},
        {"port", required_argument, nullptr, 'p'},
        {"auth", required_argument, nullptr, FLAG_AUTH},
        {nullptr, 0, nullptr, 0},
    };

    int opt;
    while ((opt = getopt_long(argc, argv, ":d:p:", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'd':
            out.root_dir = optarg;
            break;
        case 'p': {
            std::uint64_t port = 0;
            if (!parse_unsigned(optarg, port) || port > 65535) {
                error = std::string("invalid port: ") + optarg;
                return false;
            }
            out.port = static_cast<std::uint16_t>(port);
            break;
        }
        case FLAG_AUTH: {
            std::string credentials = optarg;
            size_t colon = credentials.find(':');
            if (colon == std::string::npos || colon == 0) {
                error = "invalid --auth, expected USER:PASS";
                return false;
            }
            out.auth_user = credentials.substr(0, colon);
            out.auth_password = credentials.substr(colon + 1);
            break;
        }
        case ':':
            error = std::string("missing value for ") + argv[optind - 1];
            return false;
        default:
            error = describe_bad_option(argc, argv);
            return false;
        }
    }

    if (optind < argc) {
        error = std::string("unexpected argument: ") + argv[optind];
        return false;
    }
    return true;
}
} // namespace

client_options::client_options() {
    download.auto_chunk = true;
}

std::string default_output_path(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    std::string name = path.substr(path.find_last_of('/') + 1);
    if (name.empty()) {
        name = FALLBACK_FILE_NAME;
    }
    return DEFAULT_DOWNLOAD_DIR + name;
}

bool parse_cli_options(int argc, char** argv, cli_options& out, std::string& error) {
    out = cli_options();
    if (argc < 2) {
        out.command = command_kind::help;
        return true;
    }

    // getopt keeps global state; 0 forces a full rescan
    optind = 0;
    opterr = 0;

    std::string command = argv[1];
    if (command == "--version" || command == "-v") {
        out.command = command_kind::version;
        return true;
    }
    if (command == "--help" || command == "-h" || command == "help") {
        out.command = command_kind::help;
        return true;
    }
    if (command == "client") {
        out.command = command_kind::client;
        return parse_client(argc - 1, argv + 1, out.client, error);
    }
    if (command == "server") {
        out.command = command_kind::server;
        return parse_server(argc - 1, argv + 1, out.server, error);
    }

    error = "unknown command \"" + command + "\"";
    return false;
}

std::string usage() {
    return "EZFT (Easy File Transfer) - a resumable, concurrent file transfer tool\n"
           "\n"
           "Usage:\n"
           "  ezft client --url URL [flags]\n"
           "  ezft server [flags]\n"
           "  ezft --version\n"
           "\n"
           "Client flags:\n"
           "  -u, --url URL            download URL (required)\n"
           "  -o, --output PATH        output file path (default down/<file name>)\n"
           "  -s, --chunk-size N       chunk size in bytes (default 1048576)\n"
           "  -c, --concurrency N      concurrent chunk downloads (default 1)\n"
           "  -r, --retry N            retries per chunk (default 3)\n"
           "      --resume[=BOOL]      resume interrupted downloads (default true)\n"
           "      --auto-chunk[=BOOL]  pick the chunk size from the file size (default true)\n"
           "  -p, --progress[=BOOL]    show download progress (default true)\n"
           "      --log-home DIR       log directory (default ./logs)\n"
           "      --log-level LEVEL    debug, info, warn or error (default debug)\n"
           "\n"
           "Server flags:\n"
           "  -d, --dir DIR            file root directory (default ./)\n"
           "  -p, --port N             service port (default 8080)\n"
           "      --auth USER:PASS     require HTTP basic authentication\n";
}
