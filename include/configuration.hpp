//
// Created by garrett on 2/23/25.
//

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include "remote_channel.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Json {
class Value;
}

/// [general] settings
struct GeneralConfig {
    std::string snapshot_prefix{"backup-snapshot"};
    bool include_intermediate_snapshots{false};
    std::string manifest_dir{"/var/lib/snapsync"};
    int num_threads{1};                 // parallel steps across datasets, parallel verification
    size_t queue_depth{16};             // chunks buffered per sink
    size_t chunk_size{1024 * 1024};     // bytes per chunk read from the send stream
    int step_timeout_seconds{0};        // 0 disables the per-step timeout
    bool verify_after_write{true};      // re-read artifacts on finalize
    std::string log_level{"info"};
};

struct TargetGroupConfig {
    std::string name;
    std::vector<std::string> paths;
    std::optional<std::string> remote;  // key into Configuration::remotes
};

struct SourceConfig {
    std::string name;
    std::vector<std::string> datasets;
    std::vector<std::string> targets;   // target group names
    bool recursive{false};
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

class Configuration {
public:

    Configuration();

    /// @brief Load a JSON config file, or every *.json file of a directory in name order
    /// @throws ConfigurationError
    static Configuration load(const std::string& path);

    /// @brief Build from an already parsed document
    /// @throws ConfigurationError
    static Configuration fromJson(const Json::Value& root);

    /// @brief Check cross references and value ranges
    /// @throws ConfigurationError
    void validate() const;

    const TargetGroupConfig& targetGroup(const std::string& name) const;
    std::optional<RemoteHost> remoteFor(const TargetGroupConfig& group) const;

    GeneralConfig general;
    std::map<std::string, RemoteHost> remotes;
    std::map<std::string, TargetGroupConfig> target_groups;
    std::vector<SourceConfig> sources;
};

/// Expand $VAR and ${VAR} from the environment; unknown variables are left as written
std::string expandEnvironment(const std::string& value);

#endif // CONFIGURATION_HPP
