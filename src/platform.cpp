#include "platform.hpp"
#include <ctime>
#include <filesystem>
#include <regex>
#include <unistd.h>

namespace toolcore {

std::string format_mode(uint32_t mode) {
    static const char* kTriplets[] = {"---", "--x", "-w-", "-wx", "r--", "r-x", "rw-", "rwx"};
    std::string out;
    out += kTriplets[(mode >> 6) & 07];
    out += kTriplets[(mode >> 3) & 07];
    out += kTriplets[mode & 07];
    return out;
}

char format_file_type(const EntryMetadata& md) {
    if (md.is_symlink) return 'l';
    if (md.is_file) return '-';
    if (md.is_dir) return 'd';
    return '-';
}

std::string format_listing_time(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%b %d %H:%M", &tm_buf);
    return buf;
}

// ── Unix ────────────────────────────────────────────────────────

std::optional<std::string> UnixPlatform::listing_header() const {
    return "User id: " + std::to_string(::geteuid());
}

std::string UnixPlatform::format_entry(const EntryMetadata& md, const std::string& path) const {
    std::string row;
    row += format_file_type(md);
    row += format_mode(md.mode);
    row += ' ' + std::to_string(md.nlink);
    row += ' ' + std::to_string(md.uid);
    row += ' ' + std::to_string(md.gid);
    row += ' ' + std::to_string(md.size);
    row += ' ' + format_listing_time(md.last_modified);
    row += ' ' + path;
    return row;
}

std::vector<std::string> UnixPlatform::shell_command(const std::string& shell,
                                                     const std::string& command) const {
    std::string base = std::filesystem::path(shell).filename().string();
    if (base == "bash") {
        return {shell, "--noprofile", "--norc", "-c", command};
    }
    return {shell, "-c", command};
}

// ── macOS ───────────────────────────────────────────────────────

std::string MacPlatform::pre_process_image_path(const std::string& path) const {
    if (path.find("Screenshot") == std::string::npos) return path;

    static const std::regex screenshot(
        R"((Screenshot \d{4}-\d{2}-\d{2} at \d{1,2}\.\d{2}\.\d{2}) ([AP]M))");
    return std::regex_replace(path, screenshot, "$1\xE2\x80\xAF$2");
}

// ── Windows ─────────────────────────────────────────────────────

std::string WindowsPlatform::format_entry(const EntryMetadata& md, const std::string& path) const {
    std::string row;
    row += format_file_type(md);
    row += ' ' + std::to_string(md.size);
    row += ' ' + format_listing_time(md.last_modified);
    row += ' ' + path;
    return row;
}

std::vector<std::string> WindowsPlatform::shell_command(const std::string& shell,
                                                        const std::string& command) const {
    return {shell, "-NoProfile", "-NonInteractive", "-Command", command};
}

const Platform& default_platform() {
#if defined(_WIN32)
    static const WindowsPlatform platform{};
#elif defined(__APPLE__)
    static const MacPlatform platform{};
#else
    static const UnixPlatform platform{};
#endif
    return platform;
}

} // namespace toolcore
