#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load and validate the helper configuration. The file is JSON, which
    // yaml-cpp reads as a flow-style YAML document.
    static Result<Config> load(const fs::path& path);

    // Same as load(), from an in-memory document. origin names it in errors.
    static Result<Config> parse(const std::string& text,
                                const std::string& origin = "<string>");

    // Accessors
    const std::vector<VolfileServer>& volfile_servers() const { return settings_.volfile_servers; }
    const std::string& reclock_path() const { return settings_.reclock_path; }
    const std::string& volume_name() const { return settings_.volume_name; }
    const std::string& mount_path() const { return settings_.mount_path; }
    const std::string& log_file() const { return settings_.log_file; }
    int log_level() const { return settings_.log_level; }
    int check_interval() const { return settings_.check_interval; }
    int liveness_timeout() const { return settings_.liveness_timeout; }
    int acquire_timeout() const { return settings_.acquire_timeout; }
    const std::vector<std::string>& notify_command() const { return settings_.notify_command; }

    // True when the volume is reached through libgfapi rather than a mount.
    bool uses_gfapi() const { return settings_.mount_path.empty(); }

public:
    Config() = default;

private:
    ReclockConfig settings_;
};

// The notifier argv used when the configuration does not name one.
std::vector<std::string> default_notify_command();
