/**
 * @file ProcParsers.cpp
 * @brief /proc/diskstats, /proc/self/mountstats and /proc/mdstat parsing
 */

#include "providers/ProcParsers.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <ranges>

namespace rng = std::ranges;

namespace {

constexpr std::array VIRTUAL_PREFIXES{
    std::string_view{"loop"}, std::string_view{"ram"}, std::string_view{"zram"},
    std::string_view{"dm-"},  std::string_view{"md"},  std::string_view{"sr"},
    std::string_view{"fd"},   std::string_view{"nbd"}};

constexpr std::array PSEUDO_FILESYSTEMS{
    std::string_view{"proc"},       std::string_view{"sysfs"},      std::string_view{"devpts"},
    std::string_view{"tmpfs"},      std::string_view{"devtmpfs"},   std::string_view{"cgroup"},
    std::string_view{"cgroup2"},    std::string_view{"pstore"},     std::string_view{"efivarfs"},
    std::string_view{"securityfs"}, std::string_view{"debugfs"},    std::string_view{"tracefs"},
    std::string_view{"bpf"},        std::string_view{"hugetlbfs"},  std::string_view{"mqueue"},
    std::string_view{"fusectl"},    std::string_view{"configfs"},   std::string_view{"binfmt_misc"},
    std::string_view{"overlay"},    std::string_view{"nsfs"},       std::string_view{"rpc_pipefs"},
    std::string_view{"autofs"},     std::string_view{"squashfs"}};

// statvfs on one of these blocks while the server is unreachable
constexpr std::array NETWORK_FILESYSTEMS{
    std::string_view{"nfs"},           std::string_view{"nfs4"},
    std::string_view{"cifs"},          std::string_view{"smb3"},
    std::string_view{"smbfs"},         std::string_view{"9p"},
    std::string_view{"ceph"},          std::string_view{"glusterfs"},
    std::string_view{"afs"},           std::string_view{"davfs"},
    std::string_view{"fuse.sshfs"},    std::string_view{"fuse.rclone"},
    std::string_view{"fuse.s3fs"},     std::string_view{"fuse.gcsfuse"},
    std::string_view{"fuse.glusterfs"}, std::string_view{"fuse.cephfs"},
    std::string_view{"fuse.davfs2"},   std::string_view{"fuse.gvfsd-fuse"},
    std::string_view{"fuse.curlftpfs"}};

constexpr std::array SYSTEM_MOUNT_PREFIXES{std::string_view{"/proc"}, std::string_view{"/sys"},
                                           std::string_view{"/dev"}, std::string_view{"/run/user"},
                                           std::string_view{"/snap"}};

auto split_words(std::string_view line) -> std::vector<std::string_view> {
    std::vector<std::string_view> words;
    size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        const size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        if (pos > start) {
            words.push_back(line.substr(start, pos - start));
        }
    }
    return words;
}

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto to_u64(std::string_view text) -> uint64_t {
    uint64_t value = 0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

auto to_double(std::string_view text) -> std::optional<double> {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }
    return value;
}

auto all_digits(std::string_view text) -> bool {
    return !text.empty() &&
           rng::all_of(text, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

// "[UU_]" -> true; "[2/1]" -> false
auto is_member_map(std::string_view word) -> bool {
    if (word.size() < 3 || word.front() != '[' || word.back() != ']') {
        return false;
    }
    return rng::all_of(word.substr(1, word.size() - 2), [](char c) { return c == 'U' || c == '_'; });
}

auto is_nfs_type(std::string_view fs_type) -> bool {
    return fs_type == "nfs" || fs_type == "nfs4";
}

}  // namespace

namespace procfs {

auto is_partition(std::string_view name) -> bool {
    // nvme0n1p1, mmcblk0p2: a trailing p<digits> after the base name
    if (name.starts_with("nvme") || name.starts_with("mmcblk")) {
        const auto p = name.rfind('p');
        return p != std::string_view::npos && p > 0 && all_digits(name.substr(p + 1)) &&
               std::isdigit(static_cast<unsigned char>(name[p - 1]));
    }

    if (name.starts_with("md") || name.starts_with("dm-")) {
        return false;
    }

    const auto first_digit = rng::find_if(
        name, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    if (first_digit == name.begin() || first_digit == name.end()) {
        return false;
    }
    return all_digits(name.substr(static_cast<size_t>(first_digit - name.begin())));
}

auto is_virtual_device(std::string_view name) -> bool {
    return rng::any_of(VIRTUAL_PREFIXES,
                       [name](std::string_view prefix) { return name.starts_with(prefix); });
}

auto parse_diskstats(std::string_view text, util::TimePoint captured_at)
    -> std::map<std::string, IoCounters> {
    std::map<std::string, IoCounters> devices;

    for (auto line : split_lines(text)) {
        const auto fields = split_words(line);
        if (fields.size() < 14) {
            continue;
        }

        const auto name = fields[2];
        if (is_virtual_device(name) || is_partition(name)) {
            continue;
        }

        IoCounters counters;
        counters.captured_at = captured_at;
        counters.reads_completed = to_u64(fields[3]);
        counters.sectors_read = to_u64(fields[5]);
        counters.read_time_ms = to_u64(fields[6]);
        counters.writes_completed = to_u64(fields[7]);
        counters.sectors_written = to_u64(fields[9]);
        counters.write_time_ms = to_u64(fields[10]);
        counters.io_time_ms = to_u64(fields[12]);
        devices.emplace(std::string(name), counters);
    }
    return devices;
}

auto parse_mountstats(std::string_view text) -> std::vector<NfsMountStats> {
    std::vector<NfsMountStats> mounts;
    std::optional<NfsMountStats> current;

    auto flush = [&mounts, &current] {
        if (current) {
            mounts.push_back(std::move(*current));
            current.reset();
        }
    };

    for (auto raw : split_lines(text)) {
        const auto line = trim(raw);

        // device server:/export mounted on /mnt/nfs with fstype nfs4 statvers=1.1
        if (line.starts_with("device ")) {
            flush();
            const auto words = split_words(line);
            if (words.size() >= 8 && words[2] == "mounted" && words[6] == "fstype" &&
                is_nfs_type(words[7])) {
                NfsMountStats mount;
                mount.device = std::string(words[1]);
                mount.mount = std::string(words[4]);
                mount.fs_type = std::string(words[7]);
                current = std::move(mount);
            }
            continue;
        }

        if (!current) {
            continue;
        }

        const auto words = split_words(line);
        if (words.empty()) {
            continue;
        }

        if (words[0] == "age:" && words.size() >= 2) {
            current->age_secs = to_u64(words[1]);
            continue;
        }

        // READ: ops ntrans timeouts bytes_sent bytes_recv queue rtt execute
        const bool is_read = words[0] == "READ:";
        if ((is_read || words[0] == "WRITE:") && words.size() >= 8) {
            const auto ops = to_u64(words[1]);
            const auto rtt_total = static_cast<double>(to_u64(words[7]));
            const double avg = ops > 0 ? rtt_total / static_cast<double>(ops) : 0.0;
            if (is_read) {
                current->read_ops = ops;
                current->read_rtt_ms = avg;
            } else {
                current->write_ops = ops;
                current->write_rtt_ms = avg;
            }
        }
    }
    flush();
    return mounts;
}

auto parse_mdstat(std::string_view text) -> std::vector<VolumeStatus> {
    std::vector<VolumeStatus> volumes;
    VolumeStatus* current = nullptr;
    bool faulty_member = false;
    bool missing_member = false;
    bool rebuilding = false;

    auto finish = [&] {
        if (current == nullptr) {
            return;
        }
        if (current->state == "inactive") {
            current->health = VolumeHealth::Failed;
        } else if (rebuilding) {
            current->health = VolumeHealth::Rebuilding;
        } else if (missing_member || faulty_member) {
            current->health = VolumeHealth::Degraded;
        } else {
            current->health = VolumeHealth::Healthy;
        }
        current = nullptr;
    };

    for (auto raw : split_lines(text)) {
        const auto line = trim(raw);
        if (line.empty()) {
            finish();
            continue;
        }

        // md0 : active raid1 sdb1[1] sda1[0](F)
        const auto colon = line.find(" : ");
        if (line.starts_with("md") && colon != std::string_view::npos) {
            finish();
            faulty_member = false;
            missing_member = false;
            rebuilding = false;

            VolumeStatus volume;
            volume.name = std::string(trim(line.substr(0, colon)));
            volume.kind = "md";

            const auto words = split_words(line.substr(colon + 3));
            if (!words.empty()) {
                volume.state = std::string(words[0]);
            }
            for (size_t i = 1; i < words.size(); ++i) {
                const auto word = words[i];
                if (word.starts_with("(")) {
                    continue;  // (auto-read-only)
                }
                if (volume.level.empty() &&
                    (word.starts_with("raid") || word == "linear" || word == "multipath")) {
                    volume.level = std::string(word);
                    continue;
                }
                const auto bracket = word.find('[');
                if (bracket != std::string_view::npos && bracket > 0) {
                    volume.members.emplace_back(word.substr(0, bracket));
                    if (word.ends_with("(F)")) {
                        faulty_member = true;
                    }
                }
            }
            volumes.push_back(std::move(volume));
            current = &volumes.back();
            continue;
        }

        if (current == nullptr) {
            continue;
        }

        const auto words = split_words(line);
        if (!words.empty() && is_member_map(words.back())) {
            missing_member = words.back().find('_') != std::string_view::npos;
            continue;
        }

        // [=>....]  recovery =  7.4% (72488384/976630272) finish=93.2min
        for (std::string_view op : {"recovery", "resync", "reshape"}) {
            const auto at = line.find(op);
            if (at == std::string_view::npos) {
                continue;
            }
            rebuilding = true;
            auto rest = trim(line.substr(at + op.size()));
            if (rest.starts_with("=")) {
                rest = trim(rest.substr(1));
                const auto pct_end = rest.find('%');
                if (pct_end != std::string_view::npos) {
                    current->rebuild_pct = to_double(rest.substr(0, pct_end));
                }
            }
            break;
        }
    }
    finish();
    return volumes;
}

auto is_network_filesystem(std::string_view fs_type) -> bool {
    return rng::find(NETWORK_FILESYSTEMS, fs_type) != NETWORK_FILESYSTEMS.end();
}

auto is_pseudo_mount(std::string_view device, std::string_view mount, std::string_view fs_type)
    -> bool {
    if (rng::find(PSEUDO_FILESYSTEMS, fs_type) != PSEUDO_FILESYSTEMS.end() ||
        is_network_filesystem(fs_type)) {
        return true;
    }
    if (device.starts_with("/dev/loop")) {
        return true;
    }
    return rng::any_of(SYSTEM_MOUNT_PREFIXES, [mount](std::string_view prefix) {
        return mount == prefix || (mount.starts_with(prefix) && mount.size() > prefix.size() &&
                                   mount[prefix.size()] == '/');
    });
}

}  // namespace procfs
