/**
 * @file local_transfer_demo.cpp
 * @brief Send files between two in-process devices
 *
 * This example demonstrates how to:
 * - Wire a sender and a receiver to loopback radio and overlay collaborators
 * - Advertise a session ticket and discover it from the receiving side
 * - Follow chunk progress and print the per-file outcome
 * - Stop both sides on Ctrl+C
 *
 * Usage: local_transfer_demo <file>... [--output <dir>]
 */

#include <kcenon/fastdrop/fastdrop.h>
#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/discovery/loopback_radio.h>
#include <kcenon/fastdrop/transport/loopback_network.h>

#include <atomic>
#include <csignal>
#include <future>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::fastdrop;

// Global flag for graceful shutdown
static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

int main(int argc, char* argv[]) {
    std::vector<std::filesystem::path> files;
    std::filesystem::path output_dir = "./fastdrop_downloads";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else {
            files.emplace_back(arg);
        }
    }

    if (files.empty()) {
        std::cerr << "Usage: " << argv[0] << " <file>... [--output <dir>]" << std::endl;
        return exit_status(error_code::no_input_files);
    }

    std::cout << "=== fastdrop local transfer v" << version::to_string() << " ===" << std::endl;
    std::cout << "Output: " << output_dir << std::endl;
    std::cout << std::endl;

    get_logger().initialize();
    get_logger().set_level(log_level::warn);

    // Two devices sharing one radio medium and one overlay
    auto airspace = std::make_shared<loopback_airspace>();
    auto hub = loopback_hub::create();
    auto sender_radio = std::make_shared<loopback_radio>(airspace, "AA:00:00:00:00:01");
    auto receiver_radio = std::make_shared<loopback_radio>(airspace, "AA:00:00:00:00:02");

    auto sender_result = fastdrop_sender::builder()
        .with_files(files)
        .with_peer_network(hub->create_network())
        .with_oob_channel(sender_radio)
        .with_display_name("Demo sender")
        .build();

    if (!sender_result.has_value()) {
        std::cerr << "Failed to create sender: " << sender_result.error().message << std::endl;
        return exit_status(sender_result.error().code);
    }
    auto& sender = sender_result.value();

    sender.on_session_complete([](const session_summary& summary) {
        std::cout << "[Sender] Session with " << summary.peer.value << " "
                  << to_string(summary.final_state) << ", "
                  << format_bytes(summary.bytes_sent) << " in " << summary.chunks_sent
                  << " chunks" << std::endl;
    });

    if (auto started = sender.start(); !started.has_value()) {
        std::cerr << "Failed to start sender: " << started.error().message << std::endl;
        return exit_status(started.error().code);
    }

    if (auto plan = sender.plan()) {
        std::cout << "[Sender] Advertising " << plan->manifest.size() << " file(s), "
                  << format_bytes(plan->manifest.total_size) << " over "
                  << to_string(plan->transport) << std::endl;
        for (const auto& file : plan->manifest.files) {
            std::cout << "  " << file.name << " (" << format_bytes(file.size) << ")" << std::endl;
        }
    }

    auto receiver_result = fastdrop_receiver::builder()
        .with_peer_network(hub->create_network())
        .with_oob_channel(receiver_radio)
        .with_output_directory(output_dir)
        .with_scan_window(std::chrono::milliseconds(500))
        .with_device_selector([](const std::vector<discovered_device>& devices)
                                  -> std::optional<std::size_t> {
            for (std::size_t i = 0; i < devices.size(); ++i) {
                std::cout << "[Receiver] " << (i + 1) << ": " << devices[i].display_name
                          << " (" << devices[i].address << ")" << std::endl;
            }
            return devices.empty() ? std::nullopt : std::optional<std::size_t>(1);
        })
        .build();

    if (!receiver_result.has_value()) {
        std::cerr << "Failed to create receiver: " << receiver_result.error().message
                  << std::endl;
        (void)sender.stop();
        return exit_status(receiver_result.error().code);
    }
    auto& receiver = receiver_result.value();

    receiver.on_progress([](const chunk_progress& progress) {
        std::cout << "\r[Progress] " << std::fixed << std::setprecision(1)
                  << calculate_progress(progress.bytes_received, progress.total_size) << "% ("
                  << format_bytes(progress.bytes_received) << " / "
                  << format_bytes(progress.total_size) << ")" << std::flush;
    });

    // Set up signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto pending = std::async(std::launch::async, [&receiver] { return receiver.run(); });

    while (pending.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (!running) {
            std::cout << "\nShutdown signal received..." << std::endl;
            receiver.cancel();
        }
    }
    std::cout << std::endl;

    auto outcome = pending.get();

    if (auto stopped = sender.stop(); !stopped.has_value()) {
        std::cerr << "Error during shutdown: " << stopped.error().message << std::endl;
    }

    if (!outcome.has_value()) {
        std::cerr << "Transfer failed: " << outcome.error().message << std::endl;
        return exit_status(outcome.error().code);
    }

    const auto& report = outcome.value().report;
    std::cout << "=== Transfer Outcome ===" << std::endl;
    std::cout << "Peer: " << outcome.value().peer.value << std::endl;
    std::cout << "State: " << to_string(outcome.value().final_state) << std::endl;
    std::cout << "Received: " << format_bytes(report.bytes_received) << " in "
              << report.chunks_received << " chunks" << std::endl;
    for (const auto& file : report.files) {
        std::cout << "  " << file.name << " -> " << file.path.string() << ": "
                  << to_string(file.outcome) << " (" << format_bytes(file.bytes_written) << ")"
                  << std::endl;
    }

    if (outcome.value().failure) {
        std::cerr << "Stream aborted: " << outcome.value().failure.message << std::endl;
        return exit_status(outcome.value().failure.code);
    }
    return report.all_successful() ? 0 : exit_status(error_code::incomplete_transfer);
}
