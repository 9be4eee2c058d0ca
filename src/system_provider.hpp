#pragma once
#include "result.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace toolcore {

// Access to the process environment. Tools resolve paths and environment
// variables through this interface so tests can substitute a fake.
class SystemProvider {
public:
    virtual ~SystemProvider() = default;
    virtual std::optional<std::string> env_var(const std::string& name) const = 0;
    virtual std::optional<std::string> home_dir() const = 0;
    virtual std::string current_dir() const = 0;
};

class RealSystemProvider : public SystemProvider {
public:
    std::optional<std::string> env_var(const std::string& name) const override;
    std::optional<std::string> home_dir() const override;
    std::string current_dir() const override;
};

// Expands "~", "$VAR" and "${VAR}", makes the path absolute against the
// provider's current directory and normalizes it lexically. Symlinks are
// not resolved and the path need not exist.
Result<std::filesystem::path, std::string> canonicalize_path(const std::string& path,
                                                             const SystemProvider& provider);

} // namespace toolcore
