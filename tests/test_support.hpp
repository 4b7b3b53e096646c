#pragma once

/**
 * @file test_support.hpp
 * @brief Shared fixtures for the LicenseGuard test suites
 */

#include <licenseguard/device.hpp>
#include <licenseguard/guard.hpp>
#include <licenseguard/json.hpp>
#include <licenseguard/key_codec.hpp>
#include <licenseguard/registry.hpp>
#include <licenseguard/storage.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace licenseguard {
namespace test_support {

constexpr const char* kSigningKey = "unit-test-signing-key";

// Helper to create a temporary directory for tests
class TempDirectory {
  public:
    TempDirectory() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("licenseguard_test_" +
                 std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + "_" +
                 std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

  private:
    std::filesystem::path path_;
};

/// Parse an ISO-8601 literal; tests only pass valid ones
inline Timestamp at(const std::string& iso) { return json::parse_timestamp(iso).value(); }

/// Clock the test advances by hand; copies of clock() observe every change
class ManualClock {
  public:
    explicit ManualClock(Timestamp start = at("2025-03-01T09:00:00.000Z"))
        : millis_(std::make_shared<std::atomic<int64_t>>(json::to_epoch_millis(start))) {}

    [[nodiscard]] Timestamp now() const { return json::from_epoch_millis(millis_->load()); }

    void set(Timestamp t) { millis_->store(json::to_epoch_millis(t)); }

    void advance(std::chrono::milliseconds delta) { millis_->fetch_add(delta.count()); }

    [[nodiscard]] Clock clock() const {
        auto millis = millis_;
        return [millis]() { return json::from_epoch_millis(millis->load()); };
    }

  private:
    std::shared_ptr<std::atomic<int64_t>> millis_;
};

/// Device provider whose attributes the test controls
class FakeDeviceInfoProvider : public DeviceInfoProvider {
  public:
    FakeDeviceInfoProvider() {
        state_.machine_id = "a1b2c3d4e5f60718293a4b5c6d7e8f90";
        state_.platform = "linux";
        state_.arch = "x64";
        state_.hostname = "reception-pc";
        state_.mac_addresses = {"3c:22:fb:11:22:33", "3c:22:fb:44:55:66"};
        state_.cpu_info = "Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz-8";
        state_.memory_info = "16";
        state_.os_release = "6.5.0-35-generic";
    }

    /// A provider describing a different physical machine
    static std::shared_ptr<FakeDeviceInfoProvider> other_machine() {
        auto device = std::make_shared<FakeDeviceInfoProvider>();
        device->update([](DeviceFingerprint& fp) {
            fp.machine_id = "ffeeddccbbaa99887766554433221100";
            fp.hostname = "front-desk";
            fp.mac_addresses = {"f0:18:98:aa:bb:cc"};
            fp.cpu_info = "Apple M2-8";
        });
        return device;
    }

    template <typename Fn> void update(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(state_);
    }

    std::string machine_id() const override { return get().machine_id; }
    std::string platform() const override { return get().platform; }
    std::string arch() const override { return get().arch; }
    std::string hostname() const override { return get().hostname; }
    std::vector<std::string> mac_addresses() const override { return get().mac_addresses; }
    std::string cpu_info() const override { return get().cpu_info; }
    std::string memory_info() const override { return get().memory_info; }
    std::string os_release() const override { return get().os_release; }

  private:
    DeviceFingerprint get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    DeviceFingerprint state_;
    mutable std::mutex mutex_;
};

/// Signed license data as the key generator would issue it
inline RawLicenseData make_license(const std::string& license_id, int max_days,
                                   LicenseType type = LicenseType::Standard,
                                   const std::string& signing_key = kSigningKey) {
    RawLicenseData data;
    data.license_id = license_id;
    data.license_type = type;
    data.max_days = max_days;
    data.created_at = "2025-01-15T10:30:00.000Z";
    data.features = {"patients", "appointments", "payments"};
    data.metadata = {{"clinic", "Smile Dental"}};
    data.signature = KeyCodec(signing_key).sign(data);
    return data;
}

/// Distributable base64 key text
inline std::string make_key(const std::string& license_id, int max_days,
                            LicenseType type = LicenseType::Standard,
                            const std::string& signing_key = kSigningKey) {
    return KeyCodec(signing_key).encode(make_license(license_id, max_days, type, signing_key));
}

/**
 * @brief One installation of the application: its own store, registry and device
 */
struct Installation {
    std::shared_ptr<StorageInterface> storage;
    std::shared_ptr<RegistryInterface> registry;
    std::shared_ptr<FakeDeviceInfoProvider> device;
    std::unique_ptr<Guard> guard;
};

inline Installation make_installation(
    const ManualClock& clock,
    std::shared_ptr<FakeDeviceInfoProvider> device = std::make_shared<FakeDeviceInfoProvider>(),
    std::shared_ptr<StorageInterface> storage = std::make_shared<MemoryStorage>(),
    std::shared_ptr<RegistryInterface> registry = std::make_shared<MemoryRegistry>(),
    GuardOptions options = {}) {
    Installation install;
    install.storage = std::move(storage);
    install.registry = std::move(registry);
    install.device = std::move(device);
    install.guard = std::make_unique<Guard>(install.storage, install.registry,
                                            std::make_shared<FingerprintEngine>(install.device),
                                            KeyCodec(kSigningKey), options, clock.clock());
    return install;
}

}  // namespace test_support
}  // namespace licenseguard
