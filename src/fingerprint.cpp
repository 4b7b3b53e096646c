#include "licenseguard/fingerprint.hpp"
#include "licenseguard/crypto.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace licenseguard {

namespace {

std::string join_macs(const std::vector<std::string>& macs) {
    std::string out;
    for (const auto& mac : macs) {
        if (!out.empty()) {
            out += ',';
        }
        out += mac;
    }
    return out;
}

bool macs_intersect(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::set<std::string> lhs(a.begin(), a.end());
    return std::any_of(b.begin(), b.end(),
                       [&lhs](const std::string& mac) { return lhs.count(mac) > 0; });
}

std::string truncate_id(const std::string& id, size_t length) {
    if (id.size() <= length) {
        return id;
    }
    return id.substr(0, length) + "...";
}

}  // namespace

FingerprintEngine::FingerprintEngine(std::shared_ptr<DeviceInfoProvider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw std::invalid_argument("FingerprintEngine requires a device info provider");
    }
}

DeviceFingerprint FingerprintEngine::generate() const {
    DeviceFingerprint fp;
    fp.machine_id = provider_->machine_id();
    fp.platform = provider_->platform();
    fp.arch = provider_->arch();
    fp.hostname = provider_->hostname();
    fp.mac_addresses = provider_->mac_addresses();
    std::sort(fp.mac_addresses.begin(), fp.mac_addresses.end());
    fp.cpu_info = provider_->cpu_info();
    fp.memory_info = provider_->memory_info();
    fp.os_release = provider_->os_release();
    fp.device_signature = compute_device_signature(fp);
    return fp;
}

bool FingerprintEngine::compare(const DeviceFingerprint& a, const DeviceFingerprint& b) noexcept {
    if (a.machine_id != b.machine_id || a.platform != b.platform || a.arch != b.arch) {
        return false;
    }

    int total = 0;
    int matches = 0;

    if (!a.hostname.empty() && !b.hostname.empty()) {
        ++total;
        if (a.hostname == b.hostname) {
            ++matches;
        }
    }

    if (!a.mac_addresses.empty() && !b.mac_addresses.empty()) {
        ++total;
        if (macs_intersect(a.mac_addresses, b.mac_addresses)) {
            ++matches;
        }
    }

    if (!a.cpu_info.empty() && !b.cpu_info.empty()) {
        ++total;
        if (a.cpu_info == b.cpu_info) {
            ++matches;
        }
    }

    if (total == 0) {
        return true;
    }

    return static_cast<double>(matches) / static_cast<double>(total) >= kSecondaryMatchThreshold;
}

std::string FingerprintEngine::compute_device_signature(const DeviceFingerprint& fp) {
    std::string primary = crypto::sha256_hex(fp.machine_id + "|" + fp.platform + "|" + fp.arch);

    std::string payload = primary;
    for (const std::string* field : {&fp.hostname, &fp.cpu_info, &fp.memory_info, &fp.os_release}) {
        payload += '|';
        payload += *field;
    }
    payload += '|';
    payload += join_macs(fp.mac_addresses);

    return crypto::sha256_hex(payload);
}

DeviceInfoSummary FingerprintEngine::summarize(const DeviceFingerprint& fp) {
    DeviceInfoSummary summary;
    summary.machine_id = truncate_id(fp.machine_id, 8);
    summary.platform = fp.platform;
    summary.arch = fp.arch;
    summary.hostname = fp.hostname;

    std::string mac = fp.primary_mac();
    if (mac.size() >= 8) {
        summary.mac_address = mac.substr(0, 8) + ":xx:xx:xx";
    }

    summary.cpu_info = fp.cpu_info;
    summary.memory_info = fp.memory_info.empty() ? "" : fp.memory_info + " GB";
    summary.os_release = fp.os_release;
    summary.device_signature = truncate_id(fp.device_signature, 16);
    return summary;
}

}  // namespace licenseguard
