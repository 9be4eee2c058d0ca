#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolcore {

// Metadata for one directory entry, captured without following symlinks.
struct EntryMetadata {
    bool is_dir = false;
    bool is_file = false;
    bool is_symlink = false;
    uint32_t mode = 0;
    uint64_t nlink = 0;
    uint32_t uid = 0;
    uint32_t gid = 0;
    uint64_t size = 0;
    int64_t last_modified = 0; // seconds since the UNIX epoch
};

// Environment-dependent behaviour: line endings, listing rows, shell
// invocation, path quirks.
class Platform {
public:
    virtual ~Platform() = default;

    virtual std::string name() const = 0;
    virtual std::string newline() const = 0;

    // Line printed before a directory listing, if any.
    virtual std::optional<std::string> listing_header() const = 0;

    // One long-format listing row.
    virtual std::string format_entry(const EntryMetadata& md, const std::string& path) const = 0;

    virtual std::string default_shell() const = 0;

    // Full argv for running `command` non-interactively without profiles.
    virtual std::vector<std::string> shell_command(const std::string& shell,
                                                   const std::string& command) const = 0;

    virtual std::string pre_process_image_path(const std::string& path) const { return path; }
};

class UnixPlatform : public Platform {
public:
    std::string name() const override { return "unix"; }
    std::string newline() const override { return "\n"; }
    std::optional<std::string> listing_header() const override;
    std::string format_entry(const EntryMetadata& md, const std::string& path) const override;
    std::string default_shell() const override { return "bash"; }
    std::vector<std::string> shell_command(const std::string& shell,
                                           const std::string& command) const override;
};

// macOS screenshots put a narrow no-break space (U+202F) before AM/PM,
// which a model will type as a plain space.
class MacPlatform : public UnixPlatform {
public:
    std::string name() const override { return "macos"; }
    std::string pre_process_image_path(const std::string& path) const override;
};

class WindowsPlatform : public Platform {
public:
    std::string name() const override { return "windows"; }
    std::string newline() const override { return "\r\n"; }
    std::optional<std::string> listing_header() const override { return std::nullopt; }
    std::string format_entry(const EntryMetadata& md, const std::string& path) const override;
    std::string default_shell() const override { return "pwsh"; }
    std::vector<std::string> shell_command(const std::string& shell,
                                           const std::string& command) const override;
};

// The implementation matching the build target.
const Platform& default_platform();

// 0o644 -> "rw-r--r--"
std::string format_mode(uint32_t mode);

// 'l', 'd' or '-'
char format_file_type(const EntryMetadata& md);

// "Mon DD HH:MM" in UTC
std::string format_listing_time(int64_t epoch_seconds);

} // namespace toolcore
