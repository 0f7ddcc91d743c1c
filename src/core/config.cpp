#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

// JSON null counts as absent.
static bool present(const YAML::Node& node) {
    return node && !node.IsNull();
}

// Strip leading '/' and refuse anything that could leave the volume root.
static Result<std::string> normalize_reclock_path(const std::string& raw) {
    std::string path = raw;
    while (!path.empty() && path.front() == '/') path.erase(0, 1);
    if (path.empty()) {
        return Result<std::string>::Err("reclock_path must name a file");
    }
    for (const auto& part : fs::path(path)) {
        if (part == "..") {
            return Result<std::string>::Err(
                fmt::format("reclock_path '{}' escapes the volume root", raw));
        }
    }
    if (path.back() == '/') {
        return Result<std::string>::Err(
            fmt::format("reclock_path '{}' names a directory", raw));
    }
    return Result<std::string>::Ok(path);
}

static VolfileServer parse_volfile_server(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw YAML::Exception(node.Mark(), "volfile server entry must be an object");
    }
    VolfileServer server;
    if (!present(node["host"])) {
        throw YAML::Exception(node.Mark(), "volfile server entry is missing 'host'");
    }
    server.host = node["host"].as<std::string>();
    if (present(node["proto"])) server.proto = node["proto"].as<std::string>();
    if (present(node["port"])) server.port = node["port"].as<int>();
    return server;
}

static std::vector<std::string> parse_notify_command(const YAML::Node& node) {
    if (node.IsScalar()) {
        // A bare string is a program with no arguments
        return {node.as<std::string>()};
    }
    return node.as<std::vector<std::string>>();
}

std::vector<std::string> default_notify_command() {
    return {NOTIFY_PROGRAM, "call", NOTIFY_METHOD, NOTIFY_PAYLOAD};
}

Result<Config> Config::parse(const std::string& text, const std::string& origin) {
    Config config;
    ReclockConfig& s = config.settings_;
    s.notify_command = default_notify_command();

    try {
        YAML::Node root = YAML::Load(text);
        if (!root.IsMap()) {
            return Result<Config>::Err(
                fmt::format("Invalid config {}: top level must be an object", origin));
        }

        if (present(root["liveness_timeout"])) s.liveness_timeout = root["liveness_timeout"].as<int>();
        if (present(root["check_interval"])) s.check_interval = root["check_interval"].as<int>();
        if (present(root["acquire_timeout"])) s.acquire_timeout = root["acquire_timeout"].as<int>();
        if (present(root["reclock_path"])) s.reclock_path = root["reclock_path"].as<std::string>();
        if (present(root["volume_name"])) s.volume_name = root["volume_name"].as<std::string>();
        if (present(root["mount_path"])) s.mount_path = root["mount_path"].as<std::string>();
        if (present(root["log_file"])) s.log_file = root["log_file"].as<std::string>();
        if (present(root["log_level"])) s.log_level = root["log_level"].as<int>();

        if (present(root["volfile_servers"])) {
            const YAML::Node& servers = root["volfile_servers"];
            if (!servers.IsSequence()) {
                return Result<Config>::Err(
                    fmt::format("Invalid config {}: volfile_servers must be a list", origin));
            }
            for (const auto& n : servers) {
                s.volfile_servers.push_back(parse_volfile_server(n));
            }
        }

        if (root["notify_command"]) {
            s.notify_command = root["notify_command"].IsNull()
                ? std::vector<std::string>{}
                : parse_notify_command(root["notify_command"]);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(
            fmt::format("Failed to parse config {}: {}", origin, e.what()));
    }

    // ── Validation ──────────────────────────────────────────
    if (s.reclock_path.empty()) {
        return Result<Config>::Err(fmt::format("Invalid config {}: reclock_path is required", origin));
    }
    auto normalized = normalize_reclock_path(s.reclock_path);
    if (normalized.is_err()) {
        return Result<Config>::Err(fmt::format("Invalid config {}: {}", origin, normalized.error));
    }
    s.reclock_path = normalized.value;

    if (s.volume_name.empty()) {
        return Result<Config>::Err(fmt::format("Invalid config {}: volume_name is required", origin));
    }
    const std::pair<const char*, int> timings[] = {
        {"check_interval", s.check_interval},
        {"liveness_timeout", s.liveness_timeout},
        {"acquire_timeout", s.acquire_timeout},
    };
    for (const auto& [key, secs] : timings) {
        if (secs <= 0 || secs > MAX_TIMING_SECS) {
            return Result<Config>::Err(fmt::format(
                "Invalid config {}: {} must be between 1 and {} seconds, got {}",
                origin, key, MAX_TIMING_SECS, secs));
        }
    }
    if (s.mount_path.empty() && s.volfile_servers.empty()) {
        return Result<Config>::Err(fmt::format(
            "Invalid config {}: at least one volfile server is required", origin));
    }
    for (const auto& server : s.volfile_servers) {
        if (server.host.empty()) {
            return Result<Config>::Err(fmt::format("Invalid config {}: empty volfile server host", origin));
        }
        if (server.port <= 0 || server.port > 65535) {
            return Result<Config>::Err(fmt::format(
                "Invalid config {}: volfile server {} has invalid port {}", origin, server.host, server.port));
        }
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(fmt::format("Failed to open config {}: {}",
                                               path.string(), errno_message(errno)));
    }
    std::stringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Result<Config>::Err("Failed to read config " + path.string());
    }

    return parse(buf.str(), path.string());
}
