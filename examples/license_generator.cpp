/**
 * @file license_generator.cpp
 * @brief Issue and inspect signed license keys
 *
 * Issue a key:
 *   license_generator issue --key <signing-key> --type premium --days 365 \
 *       --feature patients --feature payments --meta clinic="Smile Dental"
 *
 * Check a key:
 *   license_generator inspect --key <signing-key> <license-key>
 *
 * The signing key may also come from LICENSEGUARD_SIGNING_KEY.
 */

#include <licenseguard/json.hpp>
#include <licenseguard/key_codec.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string generate_license_id() {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

    std::random_device rd;
    std::ostringstream out;
    out << "LIC-" << millis << "-" << std::hex << std::setw(8) << std::setfill('0') << rd();
    return out.str();
}

int issue(const licenseguard::KeyCodec& codec, const std::string& id, const std::string& type,
          int days, const std::vector<std::string>& features,
          const std::vector<std::string>& metadata, bool as_json) {
    licenseguard::RawLicenseData data;
    data.license_id = id.empty() ? generate_license_id() : id;
    data.license_type = licenseguard::license_type_from_string(type).value();
    data.max_days = days;
    data.created_at = licenseguard::json::format_timestamp(std::chrono::system_clock::now());
    data.features = features.empty() ? std::vector<std::string>{"all"} : features;
    for (const auto& entry : metadata) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Metadata must be key=value: " << entry << "\n";
            return 2;
        }
        data.metadata[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    data.signature = codec.sign(data);

    if (as_json) {
        std::cout << licenseguard::json::raw_license_to_json(data).dump(2) << "\n";
    } else {
        std::cout << codec.encode(data) << "\n";
    }

    std::cerr << "Issued " << data.license_id << " (" << type << ", " << days << " days)\n";
    return 0;
}

int inspect(const licenseguard::KeyCodec& codec, const std::string& key_text) {
    auto decoded = codec.decode(key_text);
    if (decoded.is_error()) {
        std::cerr << "Invalid key: " << decoded.error_message() << "\n";
        return 1;
    }

    const auto& data = decoded.value();
    std::cout << licenseguard::json::raw_license_to_json(data).dump(2) << "\n";

    if (!codec.verify(data)) {
        std::cerr << "Signature: INVALID\n";
        return 1;
    }
    std::cerr << "Signature: valid\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"LicenseGuard key generator"};
    app.require_subcommand(1);

    std::string signing_key;
    app.add_option("-k,--key", signing_key, "HMAC signing key")
        ->envname("LICENSEGUARD_SIGNING_KEY")
        ->required();

    std::string id;
    std::string type = "standard";
    int days = 30;
    std::vector<std::string> features;
    std::vector<std::string> metadata;
    bool as_json = false;

    auto issue_cmd = app.add_subcommand("issue", "Issue a new signed license key");
    issue_cmd->add_option("--id", id, "License id (generated when omitted)");
    issue_cmd->add_option("-t,--type", type, "License type")
        ->check(CLI::IsMember({"trial", "standard", "premium", "enterprise"}));
    issue_cmd->add_option("-d,--days", days, "Validity in days after activation")
        ->check(CLI::Range(1, 36500));
    issue_cmd->add_option("-f,--feature", features, "Enabled feature (repeatable)");
    issue_cmd->add_option("-m,--meta", metadata, "Metadata as key=value (repeatable)");
    issue_cmd->add_flag("--json", as_json, "Print raw JSON instead of base64");

    std::string key_text;
    auto inspect_cmd = app.add_subcommand("inspect", "Decode a license key and check its signature");
    inspect_cmd->add_option("license-key", key_text, "Key text (raw JSON or base64)")->required();

    CLI11_PARSE(app, argc, argv);

    licenseguard::KeyCodec codec(signing_key);

    if (*issue_cmd) {
        return issue(codec, id, type, days, features, metadata, as_json);
    }
    return inspect(codec, key_text);
}
