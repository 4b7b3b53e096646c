/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the LicenseGuard engine
 *
 * This example demonstrates how to:
 * - Create an activation service from a configuration
 * - Subscribe to license events
 * - Check the stored license at startup
 * - Activate a license key entered by the user
 * - Show license and device details
 * - Keep re-validating while the application runs
 *
 * Usage: basic_usage <signing-key> [license-key]
 */

#include <licenseguard/events.hpp>
#include <licenseguard/json.hpp>
#include <licenseguard/licenseguard.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <signing-key> [license-key]\n";
        return 2;
    }

    // Configure the service
    licenseguard::Config config;
    config.signing_key = argv[1];
    config.storage_path = "/tmp/licenseguard_demo";
    config.check_interval_seconds = 2.0;

    licenseguard::ActivationService service(config);

    // Example 0: Subscribe to events
    auto status_sub = service.on(licenseguard::events::STATUS_CHANGED, [](const std::any& data) {
        const auto& result = std::any_cast<const licenseguard::LicenseValidationResult&>(data);
        std::cout << "[Event] License status is now "
                  << licenseguard::license_status_to_string(result.status) << "\n";
    });

    auto blocked_sub = service.on(licenseguard::events::LICENSE_BLOCKED, [](const std::any& data) {
        const auto& result = std::any_cast<const licenseguard::LicenseValidationResult&>(data);
        std::cout << "[Event] Application locked: " << result.error << "\n";
    });

    // Example 1: Startup check
    std::cout << "\n=== Startup Check ===\n";
    auto status = service.verify_license();
    std::cout << "First run: " << (service.is_first_run() ? "yes" : "no") << "\n";
    std::cout << "Status: " << licenseguard::license_status_to_string(status.status) << "\n";

    // Example 2: Activate a license key
    if (!status.is_valid() && argc > 2) {
        std::cout << "\n=== License Activation ===\n";
        auto outcome = service.activate(argv[2]);

        if (outcome.success) {
            std::cout << "Activated " << outcome.license->license_id << " until "
                      << licenseguard::json::format_timestamp(outcome.license->expires_at) << "\n";
        } else {
            std::cerr << "Activation failed: " << outcome.error << "\n";

            // Handle specific error codes
            switch (outcome.error_code.value_or(licenseguard::ErrorCode::Unknown)) {
                case licenseguard::ErrorCode::LicenseAlreadyRegistered:
                    std::cerr << "Deactivate the license on the original device first.\n";
                    break;
                case licenseguard::ErrorCode::LicensePermanentlyDeactivated:
                    std::cerr << "This key was deactivated. Please obtain a new key.\n";
                    break;
                case licenseguard::ErrorCode::InvalidKey:
                case licenseguard::ErrorCode::SignatureInvalid:
                    std::cerr << "Check the key and enter it again.\n";
                    break;
                default:
                    break;
            }
        }
    }

    // Example 3: License and device details
    std::cout << "\n=== License Details ===\n";
    if (auto info = service.get_license_info()) {
        std::cout << "License: " << info->license_id << " ("
                  << licenseguard::license_type_to_string(info->license_type) << ")\n";
        std::cout << "Remaining days: " << info->remaining_days
                  << (info->is_expiring_soon ? " (expiring soon)" : "") << "\n";
        std::cout << "Bound device: " << info->device_id << "\n";
        for (const auto& feature : info->features) {
            std::cout << "Feature: " << feature << "\n";
        }
    } else {
        std::cout << "No license stored.\n";
    }

    auto device = service.get_current_device_info();
    std::cout << "This device: " << device.machine_id << " " << device.platform << "/"
              << device.arch << " " << device.hostname << " " << device.mac_address << "\n";

    // Example 4: Periodic re-validation
    std::cout << "\n=== Auto-Validation ===\n";
    service.start_auto_validation();
    std::this_thread::sleep_for(std::chrono::seconds(5));
    service.stop_auto_validation();

    std::cout << "Can proceed: " << (service.can_proceed() ? "yes" : "no") << "\n";
    return 0;
}
