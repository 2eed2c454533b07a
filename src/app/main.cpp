#include "mirror/app/command_line.hpp"
#include "mirror/events/components.hpp"
#include "mirror/events/event_bus.hpp"
#include "mirror/ledger/ledger.hpp"
#include "mirror/net/curl_remote_source.hpp"
#include "mirror/orchestrator/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

// Only process-wide state: set from the signal handler, polled by crawler, pool and transfers
std::atomic<bool> g_interrupted{false};

extern "C" void handle_signal(int) {
    g_interrupted.store(true);
}

int forget(const mirror::MirrorConfig& config, const std::string& location) {
    auto opened = mirror::ledger::Ledger::open(config.ledger_path);
    if (opened.is_error()) {
        spdlog::error("Cannot open ledger: {}", mirror::describe(opened.error()));
        return mirror::orchestrator::kExitFatalLedger;
    }

    auto removed = opened.value()->remove(location);
    if (removed.is_error()) {
        spdlog::error("Cannot update ledger: {}", mirror::describe(removed.error()));
        return mirror::orchestrator::kExitFatalLedger;
    }
    if (!removed.value()) {
        spdlog::warn("No ledger record for {}", location);
        return mirror::orchestrator::kExitFailure;
    }
    spdlog::info("Forgot {}; the next run will fetch it again", location);
    return mirror::orchestrator::kExitSuccess;
}

int count(const mirror::MirrorConfig& config, mirror::net::RemoteSource& remote, mirror::events::EventBus& bus) {
    const auto report = mirror::orchestrator::count_files(config, remote, bus, &g_interrupted);
    if (report.filtered_out > 0) {
        spdlog::info("{} files excluded by region filter", report.filtered_out);
    }
    std::cout << report.files << std::endl;

    if (g_interrupted.load()) {
        return mirror::orchestrator::kExitInterrupted;
    }
    if (report.crawl_errors.size() > config.crawl_error_tolerance) {
        return mirror::orchestrator::kExitFailure;
    }
    return mirror::orchestrator::kExitSuccess;
}

int run(const mirror::MirrorConfig& config,
        mirror::net::RemoteSource& remote,
        mirror::events::EventBus& bus,
        const std::optional<std::string>& summary_json) {
    auto opened = mirror::ledger::Ledger::open(config.ledger_path);
    if (opened.is_error()) {
        spdlog::error("Cannot open ledger: {}", mirror::describe(opened.error()));
        return mirror::orchestrator::kExitFatalLedger;
    }
    auto& ledger = *opened.value();

    mirror::events::ProgressComponent progress(bus, config.progress_interval);
    mirror::orchestrator::MirrorOrchestrator orchestrator(config, remote, ledger, bus, &g_interrupted);

    const auto summary = orchestrator.run();
    const int code = summary.exit_code(config.crawl_error_tolerance);
    mirror::orchestrator::log_summary(summary);

    if (summary_json) {
        auto written = mirror::orchestrator::write_summary_json(*summary_json, summary, code);
        if (written.is_error()) {
            spdlog::error("{}", mirror::describe(written.error()));
        }
    }

    ledger.close();
    return code;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = mirror::app::parse_command_line(argc, argv);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().message);
        mirror::app::print_usage(std::cerr, argv[0]);
        return mirror::orchestrator::kExitConfigError;
    }
    const auto& command_line = parsed.value();

    if (command_line.action == mirror::app::Action::Help) {
        mirror::app::print_usage(std::cout, argv[0]);
        return mirror::orchestrator::kExitSuccess;
    }
    if (command_line.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto resolved = mirror::app::resolve_config(command_line, mirror::process_environment());
    if (resolved.is_error()) {
        spdlog::error("{}", mirror::describe(resolved.error()));
        return mirror::orchestrator::kExitConfigError;
    }
    const auto& config = resolved.value();

    if (command_line.action == mirror::app::Action::Forget) {
        return forget(config, command_line.forget_location);
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    mirror::net::CurlRemoteSource remote(mirror::net::CurlOptions{
        config.user_agent, config.transfer_timeout, &g_interrupted});

    mirror::events::EventBus bus;
    mirror::events::LoggerComponent logger(bus);

    if (command_line.action == mirror::app::Action::Count) {
        return count(config, remote, bus);
    }
    return run(config, remote, bus, command_line.summary_json);
}
