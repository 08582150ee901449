#include "application.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

#include "util/byte_utils.hpp"
#include "util/url.hpp"

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

constexpr std::chrono::milliseconds POLL_SLICE{100};
constexpr int POLL_SLICES_PER_REPORT = 10;
constexpr int EXIT_INTERRUPTED = 130;

template <typename T>
bool parse_number(const std::string& text, T& out) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value < 0)
            return false;
        if (static_cast<unsigned long long>(value) >
            static_cast<unsigned long long>(std::numeric_limits<T>::max()))
            return false;
        out = static_cast<T>(value);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

void print_error(const engine_error& error) {
    std::cerr << "[segdl] " << to_string(error.kind) << ": " << error.message << std::endl;
}
} // namespace

void application::on_signal(int) {
    g_interrupted = 1;
}

void application::install_signal_handlers() {
    std::signal(SIGINT, &application::on_signal);
    std::signal(SIGTERM, &application::on_signal);
}

void application::print_usage() {
    std::cout
        << "usage: segdl [--config FILE] [--profile ID] <command>\n"
        << "\n"
        << "commands:\n"
        << "  get URL [--connections N] [--limit BPS] [--priority P] [--sha256 HEX]\n"
        << "          [--output NAME] [--at EPOCH_SECONDS] [--header \"Name: value\"]...\n"
        << "  resume            resume every paused job of the profile\n"
        << "  list [--status S] [--search TEXT]\n"
        << "                    print the profile's jobs as JSON\n"
        << "  detect URL        print the media detection result as JSON\n"
        << "  cancel JOB_ID     cancel one job and delete its file\n";
}

bool application::parse(int argc, char** argv, command_line& out, std::string& out_error) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto value_of = [&](std::size_t& i, std::string& value) {
        if (i + 1 >= args.size()) {
            out_error = "missing value for " + args[i];
            return false;
        }
        value = args[++i];
        return true;
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (arg == "--config") {
            if (!value_of(i, out.config_path))
                return false;
        } else if (arg == "--profile") {
            if (!value_of(i, out.profile_id))
                return false;
        } else if (arg == "--connections") {
            int connections = 0;
            if (!value_of(i, value))
                return false;
            if (!parse_number(value, connections)) {
                out_error = "invalid connection count '" + value + "'";
                return false;
            }
            out.enqueue.max_connections = connections;
        } else if (arg == "--limit") {
            std::uint64_t limit = 0;
            if (!value_of(i, value))
                return false;
            if (!parse_number(value, limit)) {
                out_error = "invalid bandwidth limit '" + value + "'";
                return false;
            }
            out.bandwidth_limit = limit;
        } else if (arg == "--priority") {
            if (!value_of(i, value))
                return false;
            if (!parse_number(value, out.enqueue.priority)) {
                out_error = "invalid priority '" + value + "'";
                return false;
            }
        } else if (arg == "--sha256") {
            if (!value_of(i, out.enqueue.expected_sha256))
                return false;
        } else if (arg == "--output") {
            if (!value_of(i, value))
                return false;
            out.enqueue.filename = value;
        } else if (arg == "--at") {
            long long seconds = 0;
            if (!value_of(i, value))
                return false;
            if (!parse_number(value, seconds)) {
                out_error = "invalid start time '" + value + "'";
                return false;
            }
            out.enqueue.scheduled_at = from_epoch_ms(seconds * 1000);
        } else if (arg == "--status") {
            if (!value_of(i, value))
                return false;
            out.query.status = job_status_from_string(value);
            if (!out.query.status) {
                out_error = "unknown status '" + value + "'";
                return false;
            }
        } else if (arg == "--search") {
            if (!value_of(i, out.query.text))
                return false;
        } else if (arg == "--header") {
            if (!value_of(i, value))
                return false;
            auto colon = value.find(':');
            if (colon == std::string::npos) {
                out_error = "header must look like \"Name: value\"";
                return false;
            }
            out.enqueue.headers[url_utils::trim(value.substr(0, colon))] =
                url_utils::trim(value.substr(colon + 1));
        } else if (arg == "--help" || arg == "-h") {
            out.command = "help";
        } else if (arg.rfind("--", 0) == 0) {
            out_error = "unknown option " + arg;
            return false;
        } else if (out.command.empty()) {
            out.command = arg;
        } else {
            out.arguments.push_back(arg);
        }
    }

    if (out.command.empty()) {
        out_error = "no command given";
        return false;
    }
    return true;
}

bool application::init(const command_line& cmd) {
    if (!cmd.config_path.empty()) {
        std::string error;
        if (!engine_config::load_file(cmd.config_path, m_config, error)) {
            std::cerr << "[segdl] " << error << std::endl;
            return false;
        }
    }

    m_storage = std::make_unique<file_storage>(m_config.state_directory);
    m_transport = std::make_unique<curl_transport>(m_config.user_agent);
    m_manager = std::make_unique<download_manager>(m_config, *m_storage, *m_transport);
    return true;
}

int application::run(int argc, char** argv) {
    command_line cmd;
    std::string error;
    if (!parse(argc, argv, cmd, error)) {
        std::cerr << "[segdl] " << error << std::endl;
        print_usage();
        return 2;
    }
    if (cmd.command == "help") {
        print_usage();
        return 0;
    }
    if (!init(cmd))
        return 1;

    int code = 2;
    if (cmd.command == "get") {
        code = run_get(cmd);
    } else if (cmd.command == "resume") {
        code = run_resume(cmd);
    } else if (cmd.command == "list") {
        code = run_list(cmd);
    } else if (cmd.command == "detect") {
        code = run_detect(cmd);
    } else if (cmd.command == "cancel") {
        code = run_cancel(cmd);
    } else {
        std::cerr << "[segdl] Unknown command " << cmd.command << std::endl;
        print_usage();
    }

    m_manager->shutdown();
    return code;
}

int application::run_get(const command_line& cmd) {
    if (cmd.arguments.size() != 1) {
        std::cerr << "[segdl] get takes exactly one URL" << std::endl;
        return 2;
    }

    auto restored = m_manager->restore(cmd.profile_id);
    if (!restored.ok()) {
        print_error(restored.error());
        return 1;
    }
    if (cmd.bandwidth_limit) {
        auto error = m_manager->set_bandwidth_limit(cmd.profile_id, *cmd.bandwidth_limit);
        if (!error.ok()) {
            print_error(error);
            return 1;
        }
    }

    install_signal_handlers();
    m_manager->start();

    auto added = m_manager->enqueue(cmd.profile_id, cmd.arguments[0], cmd.enqueue);
    if (!added.ok()) {
        print_error(added.error());
        return 1;
    }
    std::cout << "[segdl] Job " << added.value().id << " -> " << added.value().destination_path
              << std::endl;
    return wait_for_jobs(cmd.profile_id, {added.value().id});
}

int application::run_resume(const command_line& cmd) {
    auto restored = m_manager->restore(cmd.profile_id);
    if (!restored.ok()) {
        print_error(restored.error());
        return 1;
    }

    install_signal_handlers();
    m_manager->start();

    std::vector<std::string> ids;
    for (const auto& j : restored.value()) {
        if (j.status == job_status::paused) {
            auto error = m_manager->resume(cmd.profile_id, j.id);
            if (!error.ok()) {
                print_error(error);
                continue;
            }
        }
        ids.push_back(j.id);
    }
    if (ids.empty()) {
        std::cout << "[segdl] Nothing to resume" << std::endl;
        return 0;
    }
    return wait_for_jobs(cmd.profile_id, ids);
}

int application::run_list(const command_line& cmd) {
    auto restored = m_manager->restore(cmd.profile_id);
    if (!restored.ok()) {
        print_error(restored.error());
        return 1;
    }
    auto page = m_manager->query(cmd.profile_id, cmd.query);
    if (!page.ok()) {
        print_error(page.error());
        return 1;
    }
    std::cout << nlohmann::json(page.value().jobs).dump(2) << std::endl;
    return 0;
}

int application::run_detect(const command_line& cmd) {
    if (cmd.arguments.size() != 1) {
        std::cerr << "[segdl] detect takes exactly one URL" << std::endl;
        return 2;
    }
    auto detected = m_manager->detect(cmd.arguments[0], cmd.enqueue.headers);
    if (!detected.ok()) {
        print_error(detected.error());
        return 1;
    }
    std::cout << nlohmann::json(detected.value()).dump(2) << std::endl;
    return 0;
}

int application::run_cancel(const command_line& cmd) {
    if (cmd.arguments.size() != 1) {
        std::cerr << "[segdl] cancel takes exactly one job id" << std::endl;
        return 2;
    }
    auto restored = m_manager->restore(cmd.profile_id);
    if (!restored.ok()) {
        print_error(restored.error());
        return 1;
    }
    auto error = m_manager->cancel(cmd.profile_id, cmd.arguments[0]);
    if (!error.ok()) {
        print_error(error);
        return 1;
    }
    std::cout << "[segdl] Job " << cmd.arguments[0] << " cancelled" << std::endl;
    return 0;
}

int application::wait_for_jobs(const std::string& profile_id,
                                const std::vector<std::string>& job_ids) {
    int slice = 0;
    for (;;) {
        if (g_interrupted) {
            std::cout << "\n[segdl] Interrupted, pausing" << std::endl;
            for (const auto& id : job_ids) {
                auto error = m_manager->pause(profile_id, id);
                // Jobs that finished meanwhile cannot be paused
                if (!error.ok() && error.kind != error_kind::validation)
                    print_error(error);
            }
            auto error = m_manager->flush(profile_id);
            if (!error.ok())
                print_error(error);
            return EXIT_INTERRUPTED;
        }

        if (slice++ % POLL_SLICES_PER_REPORT == 0) {
            bool all_done = true;
            bool any_failed = false;
            for (const auto& id : job_ids) {
                auto progress = m_manager->get_progress(profile_id, id);
                if (!progress.ok()) {
                    print_error(progress.error());
                    any_failed = true;
                    continue;
                }
                const auto& p = progress.value();
                std::cout << "[segdl] " << id.substr(0, 8) << " " << to_string(p.status) << " "
                          << static_cast<int>(p.progress * 100.0) << "% "
                          << byte_utils::format_bytes(p.bytes_downloaded);
                if (p.file_size)
                    std::cout << "/" << byte_utils::format_bytes(*p.file_size);
                if (p.status == job_status::downloading)
                    std::cout << " " << byte_utils::format_rate(p.speed) << " eta "
                              << byte_utils::format_duration(p.eta);
                if (p.last_error != error_kind::none)
                    std::cout << " " << to_string(p.last_error) << ": " << p.last_error_message;
                std::cout << std::endl;

                if (!is_terminal(p.status))
                    all_done = false;
                else if (p.status != job_status::completed)
                    any_failed = true;
            }
            if (all_done)
                return any_failed ? 1 : 0;
        }

        std::this_thread::sleep_for(POLL_SLICE);
    }
}
