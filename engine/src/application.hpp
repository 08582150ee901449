#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/engine_config.hpp"
#include "core/download_manager.hpp"
#include "net/curl_transport.hpp"
#include "storage/file_storage.hpp"

struct command_line {
    std::string config_path;
    std::string profile_id = "default";
    std::string command;
    std::vector<std::string> arguments;

    // get
    enqueue_options enqueue;
    std::optional<std::uint64_t> bandwidth_limit;

    // list
    job_query query;
};

class application {
public:
    static application& instance() {
        static application app;
        return app;
    }

    int run(int argc, char** argv);

    // Splits argv into options and the command; false with a message on bad input.
    static bool parse(int argc, char** argv, command_line& out, std::string& out_error);

    // Remove copy/move constructors
    application(const application&) = delete;
    application& operator=(const application&) = delete;
    application(application&&) = delete;
    application& operator=(application&&) = delete;

private:
    application() = default;
    ~application() = default;

    std::unique_ptr<file_storage> m_storage;
    std::unique_ptr<curl_transport> m_transport;
    std::unique_ptr<download_manager> m_manager;
    engine_config m_config;

    static void print_usage();
    bool init(const command_line& cmd);

    int run_get(const command_line& cmd);
    int run_resume(const command_line& cmd);
    int run_list(const command_line& cmd);
    int run_detect(const command_line& cmd);
    int run_cancel(const command_line& cmd);

    // Prints progress once per second until every job in `job_ids` is terminal or
    // SIGINT arrives, in which case the jobs are paused and the state flushed.
    int wait_for_jobs(const std::string& profile_id, const std::vector<std::string>& job_ids);

    static void install_signal_handlers();
    static void on_signal(int signal_number);
};
