#pragma once

#include "cli_options.hpp"

constexpr int EXIT_CANCELLED = 130;

class application {
public:
    static application& instance() {
        static application app;
        return app;
    }

    int run(int argc, char** argv);

    // Remove copy/move constructors
    application(const application&) = delete;
    application& operator=(const application&) = delete;
    application(application&&) = delete;
    application& operator=(application&&) = delete;

private:
    application() = default;
    ~application() = default;

    int run_client_mode(const client_options& options);
    int run_server_mode(const server_config& config);
};
