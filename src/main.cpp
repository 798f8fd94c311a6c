#include "config.hpp"
#include "console_reporter.hpp"
#include "job_controller.hpp"
#include "split_engine.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <variant>

using namespace nsp_split;

namespace {

// Same period the desktop front end polls its queue at.
constexpr std::chrono::milliseconds kPollInterval{240};

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int /*signum*/) {
    g_interrupted = 1;
}

SplitRequest make_request(const AppConfig& config) {
    SplitRequest request;
    request.input_path = config.input_path;
    request.output_dir = config.output_dir;
    request.output_parent_dir = config.output_parent_dir;
    return request;
}

int run_foreground(const AppConfig& config) {
    SplitReporter silent;
    ConsoleReporter console(std::cout);
    SplitReporter& reporter = config.show_progress ? static_cast<SplitReporter&>(console) : silent;

    try {
        split_file(make_request(config), reporter);
    } catch (const SplitError& ex) {
        std::cerr << "\n[error] " << ex.what() << "\n";
        return 1;
    }
    return 0;
}

// Drains the worker's queue on a fixed schedule and replays each event through
// a console reporter, the way an interactive front end would render it.
int run_background(const AppConfig& config) {
    JobController controller;
    if (!controller.start(make_request(config))) {
        std::cerr << "[error] failed to start split worker\n";
        return 1;
    }

    SplitReporter silent;
    // The queue already thins progress events; render every one that arrives.
    ConsoleReporter console(std::cout, SteadyClock::duration::zero());
    SplitReporter& reporter = config.show_progress ? static_cast<SplitReporter&>(console) : silent;

    std::signal(SIGINT, on_sigint);

    bool cancel_sent = false;
    int exit_code = 1;
    bool finished = false;
    while (!finished) {
        if (g_interrupted != 0 && !cancel_sent) {
            std::cerr << "\n[cancel] stopping after the current chunk...\n";
            controller.cancel();
            cancel_sent = true;
        }

        for (const auto& event : controller.poll_events()) {
            std::visit(overloaded{
                [&](const InitialInfoEvent& e) { reporter.report_initial_info(e.total_parts, e.total_bytes); },
                [&](const StartPartEvent& e) { reporter.report_start_part(e.part_number, e.total_parts); },
                [&](const FinishPartEvent& e) { reporter.report_finish_part(e.part_number, e.total_parts); },
                [&](const FileProgressEvent& e) { reporter.report_file_progress(e.written_bytes, e.total_bytes); },
                [&](const ArchiveBitEvent& e) { reporter.report_archive_bit(e.error_message); },
                [&](const NormalExitEvent&) {
                    exit_code = 0;
                    finished = true;
                },
                [&](const ExceptionExitEvent& e) {
                    std::cerr << "\n[error] Failed to split (" << e.message << ")\n";
                    std::cerr << "[debug] " << e.debug << "\n";
                    exit_code = 1;
                    finished = true;
                },
            }, event);
        }

        if (!finished) {
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    std::signal(SIGINT, SIG_DFL);
    return exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    std::cout << "\n========== NSP Splitter ==========\n\n";

    int rc = 1;
    try {
        rc = config.background ? run_background(config) : run_foreground(config);
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    if (rc == 0) {
        std::cout << "\n============== Done ==============\n\n";
    }
    return rc;
}
