#include "licenseguard/device.hpp"
#include "licenseguard/crypto.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <thread>

// Platform detection
#if defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <net/if_dl.h>
#include <sys/sysctl.h>
#include <sys/types.h>
#include <sys/utsname.h>
#define LICENSEGUARD_PLATFORM_MACOS 1
#elif defined(_WIN32) || defined(_WIN64)
#include <winsock2.h>
#include <windows.h>
#include <iphlpapi.h>
#define LICENSEGUARD_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <filesystem>
#define LICENSEGUARD_PLATFORM_LINUX 1
#endif

#if !defined(LICENSEGUARD_PLATFORM_WINDOWS)
#include <unistd.h>
#endif

namespace licenseguard {
namespace device {

namespace {

constexpr uint64_t kBytesPerGiB = 1024ULL * 1024ULL * 1024ULL;

std::string format_mac(const unsigned char* bytes, size_t length) {
    if (length != 6) {
        return "";
    }
    std::string hex = crypto::hex_encode(bytes, length);
    std::string mac;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!mac.empty()) {
            mac += ':';
        }
        mac += hex.substr(i, 2);
    }
    return normalize_mac(mac);
}

std::string cpu_with_cores(std::string model) {
    model.erase(model.begin(), std::find_if(model.begin(), model.end(),
                                            [](unsigned char c) { return !std::isspace(c); }));
    while (!model.empty() && std::isspace(static_cast<unsigned char>(model.back()))) {
        model.pop_back();
    }
    if (model.empty()) {
        model = "unknown";
    }
    return model + "-" + std::to_string(std::thread::hardware_concurrency());
}

#if !defined(LICENSEGUARD_PLATFORM_WINDOWS)

std::string normalize_machine_name(const std::string& machine) {
    if (machine == "x86_64" || machine == "amd64") {
        return "x64";
    }
    if (machine == "aarch64" || machine == "arm64") {
        return "arm64";
    }
    if (machine == "i386" || machine == "i686") {
        return "ia32";
    }
    if (machine.rfind("armv", 0) == 0) {
        return "arm";
    }
    return machine;
}

std::string uname_field(bool release) {
    struct utsname info;
    if (uname(&info) != 0) {
        return "";
    }
    return release ? std::string(info.release) : std::string(info.machine);
}

#endif

#if defined(LICENSEGUARD_PLATFORM_MACOS)

std::string get_macos_platform_uuid() {
    io_registry_entry_t entry = IORegistryEntryFromPath(kIOMainPortDefault, "IOService:/");
    if (entry == 0) {
        return "";
    }

    CFTypeRef uuid_ref =
        IORegistryEntryCreateCFProperty(entry, CFSTR(kIOPlatformUUIDKey), kCFAllocatorDefault, 0);

    IOObjectRelease(entry);

    if (uuid_ref == nullptr) {
        return "";
    }

    std::string result;
    if (CFGetTypeID(uuid_ref) == CFStringGetTypeID()) {
        CFStringRef uuid_string = static_cast<CFStringRef>(uuid_ref);
        CFIndex length = CFStringGetLength(uuid_string);
        CFIndex max_size = CFStringGetMaximumSizeForEncoding(length, kCFStringEncodingUTF8) + 1;

        std::vector<char> buffer(static_cast<size_t>(max_size));
        if (CFStringGetCString(uuid_string, buffer.data(), max_size, kCFStringEncodingUTF8)) {
            result = buffer.data();
        }
    }

    CFRelease(uuid_ref);
    return result;
}

std::string sysctl_string(const char* name) {
    size_t size = 0;
    if (sysctlbyname(name, nullptr, &size, nullptr, 0) != 0 || size == 0) {
        return "";
    }
    std::vector<char> buffer(size);
    if (sysctlbyname(name, buffer.data(), &size, nullptr, 0) != 0) {
        return "";
    }
    return std::string(buffer.data());
}

#elif defined(LICENSEGUARD_PLATFORM_LINUX)

std::string read_first_line(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::string line;
    std::getline(file, line);
    return line;
}

std::string get_linux_machine_id() {
    // systemd first, then dbus, then DMI (requires root)
    for (const char* path :
         {"/etc/machine-id", "/var/lib/dbus/machine-id", "/sys/class/dmi/id/product_uuid"}) {
        std::string id = read_first_line(path);
        if (!id.empty()) {
            return id;
        }
    }
    return "";
}

#elif defined(LICENSEGUARD_PLATFORM_WINDOWS)

std::string read_registry_string(HKEY root, const char* subkey, const char* value) {
    HKEY hKey;
    LONG result = RegOpenKeyExA(root, subkey, 0, KEY_READ | KEY_WOW64_64KEY, &hKey);

    if (result != ERROR_SUCCESS) {
        return "";
    }

    char buffer[256] = {0};
    DWORD size = sizeof(buffer) - 1;
    DWORD type = REG_SZ;

    result = RegQueryValueExA(hKey, value, nullptr, &type, reinterpret_cast<LPBYTE>(buffer), &size);

    RegCloseKey(hKey);

    if (result != ERROR_SUCCESS || type != REG_SZ) {
        return "";
    }

    return std::string(buffer);
}

#endif

}  // namespace

std::string normalize_mac(const std::string& mac) {
    std::string out;
    int digits = 0;
    for (char c : mac) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            if (digits > 0 && digits % 2 == 0) {
                out += ':';
            }
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            ++digits;
        } else if (c != ':' && c != '-') {
            return "";
        }
    }
    if (digits != 12 || out == "00:00:00:00:00:00") {
        return "";
    }
    return out;
}

std::string generate_machine_id() {
    std::string raw_id;

#if defined(LICENSEGUARD_PLATFORM_MACOS)
    raw_id = get_macos_platform_uuid();
#elif defined(LICENSEGUARD_PLATFORM_LINUX)
    raw_id = get_linux_machine_id();
#elif defined(LICENSEGUARD_PLATFORM_WINDOWS)
    raw_id = read_registry_string(HKEY_LOCAL_MACHINE, "SOFTWARE\\Microsoft\\Cryptography",
                                  "MachineGuid");
#endif

    if (raw_id.empty()) {
        return "";
    }

    std::string hash = crypto::sha256_hex(raw_id);
    if (hash.length() > 32) {
        return hash.substr(0, 32);
    }

    return hash;
}

std::string get_platform_name() {
#if defined(LICENSEGUARD_PLATFORM_MACOS)
    return "macos";
#elif defined(LICENSEGUARD_PLATFORM_LINUX)
    return "linux";
#elif defined(LICENSEGUARD_PLATFORM_WINDOWS)
    return "windows";
#else
    return "unknown";
#endif
}

std::string get_arch_name() {
#if defined(LICENSEGUARD_PLATFORM_WINDOWS)
    SYSTEM_INFO info;
    GetNativeSystemInfo(&info);
    switch (info.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64:
            return "x64";
        case PROCESSOR_ARCHITECTURE_ARM64:
            return "arm64";
        case PROCESSOR_ARCHITECTURE_INTEL:
            return "ia32";
        case PROCESSOR_ARCHITECTURE_ARM:
            return "arm";
        default:
            return "unknown";
    }
#else
    std::string machine = uname_field(false);
    return machine.empty() ? "unknown" : normalize_machine_name(machine);
#endif
}

std::string get_hostname() {
#if defined(LICENSEGUARD_PLATFORM_WINDOWS)
    char hostname[256] = {0};
    DWORD size = sizeof(hostname);
    if (GetComputerNameA(hostname, &size)) {
        return std::string(hostname);
    }
#else
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
        return std::string(hostname);
    }
#endif
    return "unknown";
}

}  // namespace device

// ==================== SystemDeviceInfoProvider ====================

std::string SystemDeviceInfoProvider::machine_id() const { return device::generate_machine_id(); }

std::string SystemDeviceInfoProvider::platform() const { return device::get_platform_name(); }

std::string SystemDeviceInfoProvider::arch() const { return device::get_arch_name(); }

std::string SystemDeviceInfoProvider::hostname() const { return device::get_hostname(); }

std::vector<std::string> SystemDeviceInfoProvider::mac_addresses() const {
    std::vector<std::string> macs;

#if defined(LICENSEGUARD_PLATFORM_LINUX)
    std::vector<std::string> virtual_macs;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/sys/class/net", ec)) {
        if (entry.path().filename() == "lo") {
            continue;
        }
        std::string mac =
            device::normalize_mac(device::read_first_line(entry.path() / "address"));
        if (mac.empty()) {
            continue;
        }
        // Interfaces without a backing device are bridges, veths, tunnels
        if (std::filesystem::exists(entry.path() / "device", ec)) {
            macs.push_back(mac);
        } else {
            virtual_macs.push_back(mac);
        }
    }
    if (macs.empty()) {
        macs = std::move(virtual_macs);
    }
#elif defined(LICENSEGUARD_PLATFORM_MACOS)
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) == 0) {
        for (struct ifaddrs* ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {
            if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_LINK ||
                (ifa->ifa_flags & IFF_LOOPBACK) != 0) {
                continue;
            }
            auto* sdl = reinterpret_cast<struct sockaddr_dl*>(ifa->ifa_addr);
            std::string mac = device::format_mac(
                reinterpret_cast<const unsigned char*>(LLADDR(sdl)), sdl->sdl_alen);
            if (!mac.empty()) {
                macs.push_back(mac);
            }
        }
        freeifaddrs(addrs);
    }
#elif defined(LICENSEGUARD_PLATFORM_WINDOWS)
    ULONG size = 15000;
    std::vector<unsigned char> buffer(size);
    ULONG flags = GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST | GAA_FLAG_SKIP_DNS_SERVER;
    ULONG result = GetAdaptersAddresses(AF_UNSPEC, flags, nullptr,
                                        reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()),
                                        &size);
    if (result == ERROR_BUFFER_OVERFLOW) {
        buffer.resize(size);
        result = GetAdaptersAddresses(AF_UNSPEC, flags, nullptr,
                                      reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()),
                                      &size);
    }
    if (result == NO_ERROR) {
        for (auto* adapter = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data());
             adapter != nullptr; adapter = adapter->Next) {
            if (adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK) {
                continue;
            }
            std::string mac =
                device::format_mac(adapter->PhysicalAddress, adapter->PhysicalAddressLength);
            if (!mac.empty()) {
                macs.push_back(mac);
            }
        }
    }
#endif

    std::sort(macs.begin(), macs.end());
    macs.erase(std::unique(macs.begin(), macs.end()), macs.end());
    return macs;
}

std::string SystemDeviceInfoProvider::cpu_info() const {
#if defined(LICENSEGUARD_PLATFORM_LINUX)
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    std::string model;
    while (std::getline(cpuinfo, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, colon);
        if (key.rfind("model name", 0) == 0 || key.rfind("Hardware", 0) == 0 ||
            key.rfind("cpu model", 0) == 0) {
            model = line.substr(colon + 1);
            break;
        }
    }
    return device::cpu_with_cores(model);
#elif defined(LICENSEGUARD_PLATFORM_MACOS)
    return device::cpu_with_cores(device::sysctl_string("machdep.cpu.brand_string"));
#elif defined(LICENSEGUARD_PLATFORM_WINDOWS)
    return device::cpu_with_cores(device::read_registry_string(
        HKEY_LOCAL_MACHINE, "HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\0",
        "ProcessorNameString"));
#else
    return device::cpu_with_cores("");
#endif
}

std::string SystemDeviceInfoProvider::memory_info() const {
    uint64_t total = 0;

#if defined(LICENSEGUARD_PLATFORM_LINUX)
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        total = static_cast<uint64_t>(info.totalram) * info.mem_unit;
    }
#elif defined(LICENSEGUARD_PLATFORM_MACOS)
    size_t size = sizeof(total);
    if (sysctlbyname("hw.memsize", &total, &size, nullptr, 0) != 0) {
        total = 0;
    }
#elif defined(LICENSEGUARD_PLATFORM_WINDOWS)
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (GlobalMemoryStatusEx(&status)) {
        total = status.ullTotalPhys;
    }
#endif

    if (total == 0) {
        return "";
    }
    return std::to_string(total / device::kBytesPerGiB);
}

std::string SystemDeviceInfoProvider::os_release() const {
#if defined(LICENSEGUARD_PLATFORM_WINDOWS)
    return device::read_registry_string(HKEY_LOCAL_MACHINE,
                                        "SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion",
                                        "CurrentBuildNumber");
#else
    return device::uname_field(true);
#endif
}

}  // namespace licenseguard
