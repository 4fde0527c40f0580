/**
 * @file LinuxProvider.cpp
 * @brief Kernel-backed reading provider
 */

#include "providers/LinuxProvider.hpp"

#include "providers/ProcParsers.hpp"
#include "util/Logger.hpp"

#include <sys/statvfs.h>

#include <mntent.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace {

constexpr auto BYTES_PER_SECTOR = uint64_t{512};

auto read_attribute(const fs::path& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::string value;
    std::getline(file, value);
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string{};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

auto cancelled_error(const FetchContext& ctx, std::string_view what) -> util::Error {
    return util::Error{util::ErrorKind::TransientFetchError,
                       std::format("{} {}", what, ctx.cancelled() ? "cancelled" : "timed out")};
}

}  // namespace

LinuxProvider::LinuxProvider(fs::path sys_root, fs::path proc_root, fs::path dev_root)
    : sys_root_(std::move(sys_root)),
      proc_root_(std::move(proc_root)),
      dev_root_(std::move(dev_root)) {}

auto LinuxProvider::transport_from_path(std::string_view name, std::string_view sys_path)
    -> std::string {
    if (name.starts_with("nvme")) {
        return "nvme";
    }
    if (name.starts_with("mmcblk")) {
        return "mmc";
    }
    if (sys_path.contains("/usb")) {
        return "usb";
    }
    if (sys_path.contains("/virtio")) {
        return "virtio";
    }
    if (sys_path.contains("/ata")) {
        return "sata";
    }
    return {};
}

auto LinuxProvider::supports_smart(const DeviceIdentity& device) -> bool {
    if (device.kind == DeviceKind::NVMe) {
        return true;
    }
    // USB bridges rarely pass SMART through; virtual and MMC devices have none
    if (device.transport == "usb" || device.transport == "virtio" || device.transport == "mmc") {
        return false;
    }
    return !(device.id.starts_with("vd") || device.id.starts_with("xvd") ||
             device.id.starts_with("mmcblk"));
}

auto LinuxProvider::read_identity(const fs::path& block_dir) const
    -> std::optional<DeviceIdentity> {
    DeviceIdentity identity;
    identity.id = block_dir.filename().string();

    const auto sectors = read_attribute(block_dir / "size");
    if (!sectors) {
        return std::nullopt;
    }
    uint64_t count = 0;
    std::istringstream(*sectors) >> count;
    if (count == 0) {
        return std::nullopt;  // empty card reader slot or ejected media
    }
    identity.capacity_bytes = count * BYTES_PER_SECTOR;

    std::error_code ec;
    const auto real_path = fs::canonical(block_dir, ec);
    identity.transport = transport_from_path(identity.id, ec ? std::string{} : real_path.string());

    if (identity.id.starts_with("nvme")) {
        identity.kind = DeviceKind::NVMe;
    } else {
        const auto rotational = read_attribute(block_dir / "queue" / "rotational");
        identity.kind = rotational.value_or("1") == "0" ? DeviceKind::SSD : DeviceKind::HDD;
    }

    identity.model = read_attribute(block_dir / "device" / "model").value_or("");
    identity.serial = read_attribute(block_dir / "device" / "serial").value_or("");
    return identity;
}

auto LinuxProvider::list_devices(const FetchContext& ctx)
    -> util::Result<std::vector<DeviceIdentity>> {
    const auto block_dir = sys_root_ / "block";
    std::error_code ec;
    fs::directory_iterator it{block_dir, ec};
    if (ec) {
        return util::fail(util::ErrorKind::ProviderUnavailable,
                          std::format("cannot list {}: {}", block_dir.string(), ec.message()),
                          ec.value());
    }

    std::vector<DeviceIdentity> devices;
    for (const auto& entry : it) {
        if (ctx.expired()) {
            return std::unexpected(cancelled_error(ctx, "device enumeration"));
        }
        const auto name = entry.path().filename().string();
        if (procfs::is_virtual_device(name) || procfs::is_partition(name)) {
            continue;
        }
        if (auto identity = read_identity(entry.path())) {
            devices.push_back(std::move(*identity));
        }
    }

    rng::sort(devices, {}, &DeviceIdentity::id);
    return devices;
}

auto LinuxProvider::read_proc(const std::string& relative) const -> util::Result<std::string> {
    const auto path = proc_root_ / relative;
    std::ifstream file(path);
    if (!file) {
        const int err = errno;
        return util::fail(util::ErrorKind::ProviderUnavailable,
                          std::format("cannot open {}: {}", path.string(), std::strerror(err)), err);
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return util::fail(util::ErrorKind::TransientFetchError,
                          std::format("read error on {}", path.string()));
    }
    return content.str();
}

auto LinuxProvider::device_node(const DeviceIdentity& device) const -> std::string {
    return (dev_root_ / device.id).string();
}

auto LinuxProvider::check_smart(const DeviceIdentity& device, const FetchContext& ctx) const
    -> util::Result<void> {
    if (ctx.expired()) {
        return std::unexpected(cancelled_error(ctx, std::format("SMART access to {}", device.id)));
    }
    if (!supports_smart(device)) {
        return util::fail(util::ErrorKind::ProviderUnavailable,
                          std::format("SMART is not available on {} ({})", device.id,
                                      device.transport.empty() ? "unknown transport"
                                                               : device.transport));
    }
    return {};
}

auto LinuxProvider::fetch_smart(const DeviceIdentity& device, const FetchContext& ctx)
    -> util::Result<SmartSnapshot> {
    if (auto ok = check_smart(device, ctx); !ok) {
        return std::unexpected(ok.error());
    }
    const auto node = device_node(device);
    return device.kind == DeviceKind::NVMe ? smart_.read_nvme(node) : smart_.read_ata(node);
}

auto LinuxProvider::fetch_io_counters(const FetchContext& ctx)
    -> util::Result<std::map<std::string, IoCounters>> {
    if (ctx.expired()) {
        return std::unexpected(cancelled_error(ctx, "diskstats read"));
    }
    auto text = read_proc("diskstats");
    if (!text) {
        return std::unexpected(text.error());
    }
    return procfs::parse_diskstats(*text, util::Clock::now());
}

auto LinuxProvider::fetch_filesystems(const FetchContext& ctx)
    -> util::Result<std::vector<FilesystemUsage>> {
    const auto mounts_path = proc_root_ / "mounts";

    auto mtab_deleter = [](FILE* f) {
        if (f)
            ::endmntent(f);
    };
    std::unique_ptr<FILE, decltype(mtab_deleter)> mtab{::setmntent(mounts_path.c_str(), "r"),
                                                       mtab_deleter};
    if (!mtab) {
        const int err = errno;
        return util::fail(util::ErrorKind::ProviderUnavailable,
                          std::format("cannot open {}: {}", mounts_path.string(), std::strerror(err)),
                          err);
    }

    // Later entries shadow earlier ones mounted on the same directory
    std::vector<FilesystemUsage> candidates;
    while (auto* entry = ::getmntent(mtab.get())) {
        if (procfs::is_pseudo_mount(entry->mnt_fsname, entry->mnt_dir, entry->mnt_type)) {
            continue;
        }
        std::erase_if(candidates,
                      [dir = std::string_view{entry->mnt_dir}](const FilesystemUsage& fs) {
                          return fs.mount == dir;
                      });
        FilesystemUsage usage;
        usage.device = entry->mnt_fsname;
        usage.mount = entry->mnt_dir;
        usage.fs_type = entry->mnt_type;
        candidates.push_back(std::move(usage));
    }

    std::vector<FilesystemUsage> filesystems;
    filesystems.reserve(candidates.size());
    for (auto& usage : candidates) {
        if (ctx.expired()) {
            return std::unexpected(cancelled_error(ctx, "filesystem scan"));
        }

        struct statvfs st{};
        if (::statvfs(usage.mount.c_str(), &st) != 0) {
            LOG_DEBUG("LinuxProvider", std::format("statvfs {} failed: {}", usage.mount,
                                                   std::strerror(errno)));
            continue;
        }

        const uint64_t fragment = st.f_frsize != 0 ? st.f_frsize : st.f_bsize;
        usage.total_bytes = static_cast<uint64_t>(st.f_blocks) * fragment;
        usage.avail_bytes = static_cast<uint64_t>(st.f_bavail) * fragment;
        const uint64_t free_bytes = static_cast<uint64_t>(st.f_bfree) * fragment;
        usage.used_bytes = usage.total_bytes > free_bytes ? usage.total_bytes - free_bytes : 0;
        usage.total_inodes = st.f_files;
        usage.free_inodes = st.f_ffree;
        if (usage.total_bytes == 0) {
            continue;
        }
        filesystems.push_back(std::move(usage));
    }

    rng::sort(filesystems, {}, &FilesystemUsage::mount);
    return filesystems;
}

auto LinuxProvider::fetch_nfs(const FetchContext& ctx) -> util::Result<std::vector<NfsMountStats>> {
    if (ctx.expired()) {
        return std::unexpected(cancelled_error(ctx, "mountstats read"));
    }
    auto text = read_proc("self/mountstats");
    if (!text) {
        return std::unexpected(text.error());
    }
    return procfs::parse_mountstats(*text);
}

auto LinuxProvider::fetch_volumes(const FetchContext& ctx)
    -> util::Result<std::vector<VolumeStatus>> {
    if (ctx.expired()) {
        return std::unexpected(cancelled_error(ctx, "mdstat read"));
    }
    std::error_code ec;
    if (!fs::exists(proc_root_ / "mdstat", ec)) {
        return std::vector<VolumeStatus>{};  // md driver not loaded, so no arrays
    }
    auto text = read_proc("mdstat");
    if (!text) {
        return std::unexpected(text.error());
    }
    return procfs::parse_mdstat(*text);
}

auto LinuxProvider::start_self_test(const DeviceIdentity& device, SelfTestType type)
    -> util::Result<void> {
    if (auto ok = check_smart(device, FetchContext{}); !ok) {
        return ok;
    }
    const auto node = device_node(device);
    auto started = device.kind == DeviceKind::NVMe ? smart_.start_nvme_self_test(node, type)
                                                   : smart_.start_ata_self_test(node, type);
    if (started) {
        LOG_INFO("LinuxProvider",
                 std::format("{} self-test started on {}", to_string(type), device.id));
    }
    return started;
}

auto LinuxProvider::fetch_self_test(const DeviceIdentity& device, const FetchContext& ctx)
    -> util::Result<SelfTestReading> {
    if (auto ok = check_smart(device, ctx); !ok) {
        return std::unexpected(ok.error());
    }
    const auto node = device_node(device);
    return device.kind == DeviceKind::NVMe ? smart_.read_nvme_self_test(node)
                                           : smart_.read_ata_self_test(node);
}
