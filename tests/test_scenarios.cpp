#include <gtest/gtest.h>
#include <licenseguard/guard.hpp>

#include "test_support.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>

/**
 * End-to-end behaviour of one or more installations driven through Guard,
 * with file-backed storage where persistence matters.
 */

namespace licenseguard {
namespace {

using test_support::FakeDeviceInfoProvider;
using test_support::Installation;
using test_support::make_installation;
using test_support::make_key;
using test_support::make_license;
using test_support::ManualClock;
using test_support::TempDirectory;

constexpr auto kDay = std::chrono::hours(24);

Installation file_installation(const ManualClock& clock, const TempDirectory& dir,
                               std::shared_ptr<FakeDeviceInfoProvider> device =
                                   std::make_shared<FakeDeviceInfoProvider>()) {
    return make_installation(clock, std::move(device),
                             std::make_shared<FileStorage>(dir.str()),
                             std::make_shared<FileRegistry>(dir.str()));
}

// ==================== Key round trip ====================

TEST(ScenarioTest, KeyRoundTripPreservesFieldsAndVerifies) {
    KeyCodec codec(test_support::kSigningKey);

    for (auto type : {LicenseType::Trial, LicenseType::Standard, LicenseType::Premium,
                      LicenseType::Enterprise}) {
        for (int days : {1, 14, 365, 3650}) {
            auto issued = make_license("LIC-RT-" + std::to_string(days), days, type);
            auto decoded = codec.decode(codec.encode(issued));

            ASSERT_TRUE(decoded.is_ok()) << decoded.error_message();
            const auto& raw = decoded.value();
            EXPECT_EQ(raw.license_id, issued.license_id);
            EXPECT_EQ(raw.license_type, issued.license_type);
            EXPECT_EQ(raw.max_days, issued.max_days);
            EXPECT_EQ(raw.created_at, issued.created_at);
            EXPECT_EQ(raw.signature, issued.signature);
            EXPECT_EQ(raw.features, issued.features);
            EXPECT_EQ(raw.metadata, issued.metadata);
            EXPECT_TRUE(codec.verify(raw));
        }
    }
}

// ==================== Fresh activation ====================

TEST(ScenarioTest, FreshActivationIsValidForFullTerm) {
    for (int days : {1, 2, 7, 30, 365, 3650}) {
        ManualClock clock;
        auto install = make_installation(clock);

        ASSERT_TRUE(install.guard->activate(make_key("LIC-F-" + std::to_string(days), days)).is_ok());
        auto result = install.guard->verify_license().result;

        EXPECT_EQ(result.status, LicenseStatus::Valid) << days;
        EXPECT_TRUE(result.remaining_days == days || result.remaining_days == days - 1) << days;
    }
}

// ==================== Expiry ====================

TEST(ScenarioTest, ExpiryIsDeterministic) {
    ManualClock clock;
    auto install = make_installation(clock);
    auto activated = install.guard->activate(make_key("LIC-E", 30));
    ASSERT_TRUE(activated.is_ok());
    auto expires = activated.value().expires_at;

    // Kernel upgrade changes the signature but not the compared fields
    install.device->update([](DeviceFingerprint& fp) { fp.os_release = "6.8.0-40-generic"; });

    for (auto offset : {std::chrono::milliseconds(0), std::chrono::milliseconds(1),
                        std::chrono::milliseconds(kDay), std::chrono::milliseconds(kDay * 1000)}) {
        clock.set(expires + offset);
        auto result = install.guard->verify_license().result;

        EXPECT_EQ(result.status, LicenseStatus::Expired);
        EXPECT_EQ(result.remaining_days, 0);
        EXPECT_FALSE(install.guard->verify_license().can_proceed);
    }
}

// ==================== Tamper detection ====================

class PersistedRecordTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(install.guard->activate(make_key("LIC-T", 30)).is_ok());
        path = std::static_pointer_cast<FileStorage>(install.storage)->license_path();
    }

    nlohmann::json read_record() const {
        std::ifstream file(path);
        return nlohmann::json::parse(
            std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>()));
    }

    void write_record(const nlohmann::json& record) const {
        std::ofstream file(path, std::ios::trunc);
        file << record.dump(2);
    }

    ManualClock clock;
    TempDirectory dir;
    Installation install = file_installation(clock, dir);
    std::filesystem::path path;
};

TEST_F(PersistedRecordTest, SingleByteSignatureChangeIsTampered) {
    auto record = read_record();
    std::string signature = record["signature"];
    signature[0] = signature[0] == '0' ? '1' : '0';
    record["signature"] = signature;
    write_record(record);

    auto decision = install.guard->verify_license();

    EXPECT_EQ(decision.result.status, LicenseStatus::Tampered);
    EXPECT_FALSE(decision.can_proceed);
}

TEST_F(PersistedRecordTest, ExtendedExpiryIsTampered) {
    auto record = read_record();
    record["expiresAt"] = record["expiresAt"].get<int64_t>() + 365LL * 86400000LL;
    write_record(record);

    EXPECT_EQ(install.guard->verify_license().result.status, LicenseStatus::Tampered);
}

TEST_F(PersistedRecordTest, UnrepresentableExpiryIsTampered) {
    auto record = read_record();
    record["expiresAt"] = std::numeric_limits<int64_t>::max();
    write_record(record);

    auto decision = install.guard->verify_license();

    EXPECT_EQ(decision.result.status, LicenseStatus::Tampered);
    EXPECT_FALSE(decision.can_proceed);
}

TEST_F(PersistedRecordTest, RaisedMaxDaysIsTampered) {
    auto record = read_record();
    record["maxDays"] = 3650;
    write_record(record);

    EXPECT_EQ(install.guard->verify_license().result.status, LicenseStatus::Tampered);
}

TEST_F(PersistedRecordTest, TruncatedRecordIsTampered) {
    auto text = read_record().dump();
    std::ofstream(path, std::ios::trunc) << text.substr(0, text.size() / 2);

    EXPECT_EQ(install.guard->verify_license().result.status, LicenseStatus::Tampered);
}

TEST_F(PersistedRecordTest, DeletedRegistryIsTampered) {
    std::filesystem::remove(std::static_pointer_cast<FileRegistry>(install.registry)->registry_path());

    EXPECT_EQ(install.guard->verify_license().result.status, LicenseStatus::Tampered);
}

TEST_F(PersistedRecordTest, SurvivesRestart) {
    clock.advance(kDay * 3);
    auto restarted = file_installation(clock, dir);

    auto result = restarted.guard->verify_license().result;

    EXPECT_EQ(result.status, LicenseStatus::Valid);
    EXPECT_EQ(result.remaining_days, 27);
}

// ==================== Device binding ====================

TEST(ScenarioTest, NoSilentDeviceSwitch) {
    ManualClock clock;
    TempDirectory dir;
    auto install = file_installation(clock, dir);
    auto first = install.guard->activate(make_key("LIC-D", 30));
    ASSERT_TRUE(first.is_ok());
    auto f1_signature = first.value().device_fingerprint.device_signature;

    // The same data directory now reports another machine
    auto moved = file_installation(clock, dir, FakeDeviceInfoProvider::other_machine());
    auto second = moved.guard->activate(make_key("LIC-D", 30));

    EXPECT_EQ(second.error_code(), ErrorCode::LicenseAlreadyRegistered);
    auto entry = moved.registry->lookup("LIC-D").value();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->device_signature, f1_signature);
    EXPECT_FALSE(entry->deactivated);
    EXPECT_EQ(moved.guard->verify_license().result.status, LicenseStatus::DeviceMismatch);
}

TEST(ScenarioTest, DeactivateThenActivateOnAnotherInstallation) {
    ManualClock clock;
    auto f1 = make_installation(clock);
    auto f2 = make_installation(clock, FakeDeviceInfoProvider::other_machine());

    ASSERT_TRUE(f1.guard->activate(make_key("LIC-C", 90)).is_ok());
    ASSERT_TRUE(f1.guard->deactivate().is_ok());
    EXPECT_FALSE(f1.guard->verify_license().can_proceed);

    auto moved = f2.guard->activate(make_key("LIC-C", 90));

    ASSERT_TRUE(moved.is_ok()) << moved.error_message();
    EXPECT_EQ(f2.guard->verify_license().result.status, LicenseStatus::Valid);
}

TEST(ScenarioTest, DeactivationIsTerminalOnTheInstallation) {
    ManualClock clock;
    TempDirectory dir;
    auto install = file_installation(clock, dir);
    ASSERT_TRUE(install.guard->activate(make_key("LIC-X", 30)).is_ok());
    ASSERT_TRUE(install.guard->deactivate().is_ok());

    std::vector<std::shared_ptr<FakeDeviceInfoProvider>> devices = {
        std::make_shared<FakeDeviceInfoProvider>(), FakeDeviceInfoProvider::other_machine()};
    for (const auto& device : devices) {
        auto attempt = file_installation(clock, dir, device);

        EXPECT_EQ(attempt.guard->activate(make_key("LIC-X", 30)).error_code(),
                  ErrorCode::LicensePermanentlyDeactivated);
        EXPECT_FALSE(attempt.guard->verify_license().can_proceed);
    }
}

// ==================== Concrete scenarios ====================

TEST(ScenarioTest, ThirtyDayLicenseCountsDown) {
    ManualClock clock;
    auto install = make_installation(clock);
    ASSERT_TRUE(install.guard->activate(make_key("LIC-A", 30)).is_ok());
    auto t0 = clock.now();

    clock.set(t0 + kDay * 29);
    auto day29 = install.guard->verify_license().result;
    EXPECT_EQ(day29.status, LicenseStatus::Valid);
    EXPECT_EQ(day29.remaining_days, 1);
    EXPECT_TRUE(day29.is_expiring_soon);

    clock.set(t0 + kDay * 31);
    EXPECT_EQ(install.guard->verify_license().result.status, LicenseStatus::Expired);
}

TEST(ScenarioTest, RenamedHostKeepsLicense) {
    ManualClock clock;
    auto install = make_installation(clock);
    ASSERT_TRUE(install.guard->activate(make_key("LIC-B", 30)).is_ok());

    install.device->update([](DeviceFingerprint& fp) { fp.hostname = "reception-pc-2"; });

    EXPECT_EQ(install.guard->verify_license().result.status, LicenseStatus::Valid);
}

TEST(ScenarioTest, ClonedSecondaryIdentifiersDoNotHelpOtherMachine) {
    ManualClock clock;
    auto install = make_installation(clock);
    ASSERT_TRUE(install.guard->activate(make_key("LIC-M", 30)).is_ok());

    install.device->update([](DeviceFingerprint& fp) { fp.machine_id = "cloned-vm-0001"; });

    auto result = install.guard->verify_license().result;
    EXPECT_EQ(result.status, LicenseStatus::DeviceMismatch);
    EXPECT_EQ(result.error_code, ErrorCode::DeviceMismatch);
}

}  // namespace
}  // namespace licenseguard
