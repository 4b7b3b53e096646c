#include <gtest/gtest.h>
#include <licenseguard/json.hpp>
#include <licenseguard/storage.hpp>

#include "test_support.hpp"

#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

namespace licenseguard {
namespace {

using test_support::at;
using test_support::TempDirectory;

ActivatedLicenseData sample_license(const std::string& id = "LIC-700") {
    ActivatedLicenseData license;
    static_cast<RawLicenseData&>(license) = test_support::make_license(id, 30);
    license.activated_at = at("2025-03-01T09:00:00.000Z");
    license.expires_at = at("2025-03-31T09:00:00.000Z");
    license.device_fingerprint.machine_id = "a1b2c3d4e5f60718293a4b5c6d7e8f90";
    license.device_fingerprint.platform = "linux";
    license.device_fingerprint.arch = "x64";
    license.device_fingerprint.hostname = "reception-pc";
    license.device_fingerprint.mac_addresses = {"3c:22:fb:11:22:33"};
    license.device_fingerprint.device_signature = "sig";
    license.original_signature = license.signature;
    license.activation_seal = "seal";
    return license;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << text;
}

// ==================== MemoryStorage Tests ====================

class MemoryStorageTest : public ::testing::Test {
  protected:
    MemoryStorage storage;
};

TEST_F(MemoryStorageTest, InitiallyEmpty) {
    auto stored = storage.get_license();

    ASSERT_TRUE(stored.is_ok());
    EXPECT_FALSE(stored.value().has_value());
    EXPECT_FALSE(storage.has_license());
}

TEST_F(MemoryStorageTest, StoreAndGet) {
    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());

    auto stored = storage.get_license();
    ASSERT_TRUE(stored.is_ok());
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->license_id, "LIC-700");
    EXPECT_TRUE(storage.has_license());
}

TEST_F(MemoryStorageTest, StoreReplacesPreviousRecord) {
    ASSERT_TRUE(storage.store_license(sample_license("LIC-701")).is_ok());
    ASSERT_TRUE(storage.store_license(sample_license("LIC-702")).is_ok());

    EXPECT_EQ(storage.get_license().value()->license_id, "LIC-702");
}

TEST_F(MemoryStorageTest, DeleteLicense) {
    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());

    EXPECT_TRUE(storage.delete_license().is_ok());
    EXPECT_FALSE(storage.has_license());
    EXPECT_TRUE(storage.delete_license().is_ok());
}

TEST_F(MemoryStorageTest, TouchLastChecked) {
    EXPECT_EQ(storage.touch_last_checked(at("2025-03-02T00:00:00Z")).error_code(),
              ErrorCode::NotActivated);

    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());
    ASSERT_TRUE(storage.touch_last_checked(at("2025-03-02T00:00:00Z")).is_ok());

    auto stored = storage.get_license().value();
    ASSERT_TRUE(stored->last_checked.has_value());
    EXPECT_EQ(*stored->last_checked, at("2025-03-02T00:00:00Z"));
}

// ==================== FileStorage Tests ====================

class FileStorageTest : public ::testing::Test {
  protected:
    TempDirectory temp_dir;
};

TEST_F(FileStorageTest, InitiallyEmpty) {
    FileStorage storage(temp_dir.str());

    auto stored = storage.get_license();
    ASSERT_TRUE(stored.is_ok());
    EXPECT_FALSE(stored.value().has_value());
    EXPECT_FALSE(storage.has_license());
}

TEST_F(FileStorageTest, LicensePathUsesPrefix) {
    FileStorage storage(temp_dir.str(), "clinic");
    EXPECT_EQ(storage.license_path(), temp_dir.path() / "clinic_license.json");
}

TEST_F(FileStorageTest, PersistsAcrossInstances) {
    auto license = sample_license();
    {
        FileStorage storage(temp_dir.str());
        ASSERT_TRUE(storage.store_license(license).is_ok());
    }

    FileStorage reopened(temp_dir.str());
    auto stored = reopened.get_license();

    ASSERT_TRUE(stored.is_ok()) << stored.error_message();
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->license_id, license.license_id);
    EXPECT_EQ(stored.value()->expires_at, license.expires_at);
    EXPECT_EQ(stored.value()->activation_seal, "seal");
    EXPECT_EQ(stored.value()->metadata, license.metadata);
}

TEST_F(FileStorageTest, CreatesMissingDirectory) {
    FileStorage storage((temp_dir.path() / "nested" / "dir").string());

    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());
    EXPECT_TRUE(std::filesystem::exists(storage.license_path()));
}

TEST_F(FileStorageTest, WriteLeavesNoTemporaryFile) {
    FileStorage storage(temp_dir.str());
    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());
    ASSERT_TRUE(storage.store_license(sample_license("LIC-701")).is_ok());

    auto tmp = storage.license_path();
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(FileStorageTest, StaleTemporaryFileIsReplacedWhole) {
    FileStorage storage(temp_dir.str());
    auto tmp = storage.license_path();
    tmp += ".tmp";
    write_text(tmp, std::string(64 * 1024, 'x'));

    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());

    EXPECT_FALSE(std::filesystem::exists(tmp));
    auto text = read_text(storage.license_path());
    EXPECT_EQ(text.find("xxxxxxxx"), std::string::npos);
    EXPECT_NO_THROW((void)nlohmann::json::parse(text));
    auto loaded = storage.get_license();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error_message();
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(loaded.value()->license_id, "LIC-700");
}

TEST_F(FileStorageTest, RecordIsCamelCaseJson) {
    FileStorage storage(temp_dir.str());
    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());

    auto j = nlohmann::json::parse(read_text(storage.license_path()));
    EXPECT_EQ(j["licenseId"], "LIC-700");
    EXPECT_EQ(j["maxDays"], 30);
    EXPECT_TRUE(j["activatedAt"].is_number_integer());
    EXPECT_TRUE(j.contains("originalSignature"));
    EXPECT_TRUE(j.contains("deviceFingerprint"));
}

TEST_F(FileStorageTest, CorruptRecordIsTampered) {
    FileStorage storage(temp_dir.str());
    write_text(storage.license_path(), "{\"licenseId\": \"LIC-700\", ");

    auto stored = storage.get_license();

    EXPECT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error_code(), ErrorCode::Tampered);
    EXPECT_TRUE(storage.has_license());
}

TEST_F(FileStorageTest, RecordMissingFieldsIsTampered) {
    FileStorage storage(temp_dir.str());
    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());

    auto j = nlohmann::json::parse(read_text(storage.license_path()));
    j.erase("expiresAt");
    write_text(storage.license_path(), j.dump());

    EXPECT_EQ(storage.get_license().error_code(), ErrorCode::Tampered);
}

TEST_F(FileStorageTest, DeleteLicense) {
    FileStorage storage(temp_dir.str());
    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());

    EXPECT_TRUE(storage.delete_license().is_ok());
    EXPECT_FALSE(storage.has_license());
    EXPECT_FALSE(storage.get_license().value().has_value());
    EXPECT_TRUE(storage.delete_license().is_ok());
}

TEST_F(FileStorageTest, TouchLastCheckedKeepsOtherFields) {
    FileStorage storage(temp_dir.str());
    ASSERT_TRUE(storage.store_license(sample_license()).is_ok());

    auto j = nlohmann::json::parse(read_text(storage.license_path()));
    j["writtenByNewerVersion"] = true;
    write_text(storage.license_path(), j.dump());

    ASSERT_TRUE(storage.touch_last_checked(at("2025-03-05T12:00:00.000Z")).is_ok());

    auto touched = nlohmann::json::parse(read_text(storage.license_path()));
    EXPECT_EQ(touched["lastChecked"].get<int64_t>(),
              json::to_epoch_millis(at("2025-03-05T12:00:00.000Z")));
    EXPECT_TRUE(touched["writtenByNewerVersion"].get<bool>());

    auto stored = storage.get_license();
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value()->last_checked, at("2025-03-05T12:00:00.000Z"));
}

TEST_F(FileStorageTest, TouchWithoutRecordIsNotActivated) {
    FileStorage storage(temp_dir.str());

    EXPECT_EQ(storage.touch_last_checked(at("2025-03-05T12:00:00Z")).error_code(),
              ErrorCode::NotActivated);
    EXPECT_FALSE(storage.has_license());
}

TEST_F(FileStorageTest, TouchOnCorruptRecordIsTampered) {
    FileStorage storage(temp_dir.str());
    write_text(storage.license_path(), "garbage");

    EXPECT_EQ(storage.touch_last_checked(at("2025-03-05T12:00:00Z")).error_code(),
              ErrorCode::Tampered);
}

TEST_F(FileStorageTest, UnwritableLocationIsStorageError) {
    // A regular file where the storage directory should be
    auto blocker = temp_dir.path() / "not-a-directory";
    write_text(blocker, "x");

    FileStorage storage((blocker / "sub").string());
    auto stored = storage.store_license(sample_license());

    EXPECT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error_code(), ErrorCode::StorageError);
}

}  // namespace
}  // namespace licenseguard
