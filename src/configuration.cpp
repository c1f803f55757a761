//
// Created by garrett on 2/24/25.
//

#include "configuration.hpp"
#include "backup_errors.hpp"

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

Json::Value parseFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Cannot open config file: " + path.string());
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    JSONCPP_STRING errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw ConfigurationError("Invalid JSON in " + path.string() + ": " + errs);
    }
    if (!root.isObject()) {
        throw ConfigurationError("Config root must be an object: " + path.string());
    }
    return root;
}

// Sections are merged member by member, scalars are replaced
void mergeInto(Json::Value& target, const Json::Value& source) {
    for (const auto& key : source.getMemberNames()) {
        const Json::Value& value = source[key];
        if (value.isObject() && target.isMember(key) && target[key].isObject()) {
            for (const auto& inner : value.getMemberNames()) {
                target[key][inner] = value[inner];
            }
        } else {
            target[key] = value;
        }
    }
}

// Sections may be absent, entries inside them must be objects
void requireObject(const Json::Value& node, const std::string& what, bool allowNull) {
    if ((allowNull && node.isNull()) || node.isObject()) {
        return;
    }
    throw ConfigurationError(what + " must be an object");
}

std::string getString(const Json::Value& node, const char* key, const std::string& fallback) {
    if (!node.isMember(key)) {
        return fallback;
    }
    if (!node[key].isString()) {
        throw ConfigurationError(std::string("'") + key + "' must be a string");
    }
    return expandEnvironment(node[key].asString());
}

bool getBool(const Json::Value& node, const char* key, bool fallback) {
    if (!node.isMember(key)) {
        return fallback;
    }
    if (!node[key].isBool()) {
        throw ConfigurationError(std::string("'") + key + "' must be a boolean");
    }
    return node[key].asBool();
}

int64_t getInt(const Json::Value& node, const char* key, int64_t fallback) {
    if (!node.isMember(key)) {
        return fallback;
    }
    if (!node[key].isIntegral()) {
        throw ConfigurationError(std::string("'") + key + "' must be an integer");
    }
    return node[key].asInt64();
}

// Accepts a list or a single comma separated string, like the ini style configs did
std::vector<std::string> getList(const Json::Value& node, const char* key) {
    std::vector<std::string> items;
    if (!node.isMember(key) || node[key].isNull()) {
        return items;
    }
    const Json::Value& value = node[key];
    if (value.isString()) {
        std::stringstream ss(value.asString());
        std::string item;
        while (std::getline(ss, item, ',')) {
            item.erase(0, item.find_first_not_of(" \t\r\n"));
            item.erase(item.find_last_not_of(" \t\r\n") + 1);
            if (!item.empty()) {
                items.push_back(expandEnvironment(item));
            }
        }
        return items;
    }
    if (!value.isArray()) {
        throw ConfigurationError(std::string("'") + key + "' must be a list of strings");
    }
    for (const auto& item : value) {
        if (!item.isString()) {
            throw ConfigurationError(std::string("'") + key + "' must be a list of strings");
        }
        items.push_back(expandEnvironment(item.asString()));
    }
    return items;
}

} // namespace

std::string expandEnvironment(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '$' || i + 1 >= value.size()) {
            result += value[i];
            continue;
        }

        size_t nameStart;
        size_t nameEnd;
        size_t consumedEnd;
        if (value[i + 1] == '{') {
            size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                result += value[i];
                continue;
            }
            nameStart = i + 2;
            nameEnd = close;
            consumedEnd = close + 1;
        } else {
            nameStart = i + 1;
            nameEnd = nameStart;
            while (nameEnd < value.size() && (std::isalnum(static_cast<unsigned char>(value[nameEnd])) || value[nameEnd] == '_')) {
                ++nameEnd;
            }
            consumedEnd = nameEnd;
        }

        std::string name = value.substr(nameStart, nameEnd - nameStart);
        const char* env = name.empty() ? nullptr : std::getenv(name.c_str());
        if (env) {
            result += env;
        } else {
            result += value.substr(i, consumedEnd - i);
        }
        i = consumedEnd - 1;
    }
    return result;
}

Configuration::Configuration() = default;

Configuration Configuration::load(const std::string& path) {
    Json::Value merged(Json::objectValue);

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(path)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        if (files.empty()) {
            throw ConfigurationError("No *.json files in config directory: " + path);
        }
        for (const auto& file : files) {
            mergeInto(merged, parseFile(file));
        }
    } else {
        merged = parseFile(path);
    }

    return fromJson(merged);
}

Configuration Configuration::fromJson(const Json::Value& root) {
    Configuration config;
    requireObject(root, "Config root", false);

    const Json::Value& general = root["general"];
    if (!general.isNull()) {
        requireObject(general, "'general'", false);
        GeneralConfig& g = config.general;
        g.snapshot_prefix = getString(general, "snapshot_prefix", g.snapshot_prefix);
        g.include_intermediate_snapshots = getBool(general, "include_intermediate_snapshots",
                                                   g.include_intermediate_snapshots);
        g.manifest_dir = getString(general, "manifest_dir", g.manifest_dir);
        g.num_threads = static_cast<int>(getInt(general, "num_threads", g.num_threads));
        g.queue_depth = static_cast<size_t>(std::max<int64_t>(0, getInt(general, "queue_depth", g.queue_depth)));
        g.chunk_size = static_cast<size_t>(std::max<int64_t>(0, getInt(general, "chunk_size", g.chunk_size)));
        g.step_timeout_seconds = static_cast<int>(getInt(general, "step_timeout_seconds", g.step_timeout_seconds));
        g.verify_after_write = getBool(general, "verify_after_write", g.verify_after_write);
        g.log_level = getString(general, "log_level", g.log_level);
    }

    const Json::Value& remotes = root["remotes"];
    requireObject(remotes, "'remotes'", true);
    for (const auto& name : remotes.getMemberNames()) {
        const Json::Value& node = remotes[name];
        requireObject(node, "Remote '" + name + "'", false);
        RemoteHost remote;
        remote.host = getString(node, "host", "");
        if (remote.host.empty()) {
            throw ConfigurationError("Remote '" + name + "' has no host");
        }
        if (node.isMember("user")) {
            remote.user = getString(node, "user", "");
        }
        if (node.isMember("port")) {
            remote.port = static_cast<int>(getInt(node, "port", 22));
        }
        if (node.isMember("key_path")) {
            remote.keyPath = getString(node, "key_path", "");
        }
        config.remotes[name] = remote;
    }

    const Json::Value& groups = root["target_groups"];
    requireObject(groups, "'target_groups'", true);
    for (const auto& name : groups.getMemberNames()) {
        const Json::Value& node = groups[name];
        requireObject(node, "Target group '" + name + "'", false);
        TargetGroupConfig group;
        group.name = name;
        group.paths = getList(node, "paths");
        if (node.isMember("remote")) {
            group.remote = getString(node, "remote", "");
        }
        config.target_groups[name] = group;
    }

    const Json::Value& sources = root["sources"];
    requireObject(sources, "'sources'", true);
    for (const auto& name : sources.getMemberNames()) {
        const Json::Value& node = sources[name];
        requireObject(node, "Source '" + name + "'", false);
        SourceConfig source;
        source.name = name;
        source.datasets = getList(node, "datasets");
        source.targets = getList(node, "targets");
        source.recursive = getBool(node, "recursive", false);
        source.include = getList(node, "include");
        source.exclude = getList(node, "exclude");
        config.sources.push_back(source);
    }

    config.validate();
    return config;
}

void Configuration::validate() const {
    if (general.snapshot_prefix.empty()) {
        throw ConfigurationError("snapshot_prefix must not be empty");
    }
    if (general.manifest_dir.empty()) {
        throw ConfigurationError("manifest_dir must not be empty");
    }
    if (general.num_threads < 1) {
        throw ConfigurationError("num_threads must be at least 1");
    }
    if (general.queue_depth < 1) {
        throw ConfigurationError("queue_depth must be at least 1");
    }
    if (general.chunk_size < 1) {
        throw ConfigurationError("chunk_size must be at least 1");
    }
    if (general.step_timeout_seconds < 0) {
        throw ConfigurationError("step_timeout_seconds must not be negative");
    }

    for (const auto& [name, group] : target_groups) {
        if (group.paths.empty()) {
            throw ConfigurationError("Target group '" + name + "' has no paths");
        }
        if (group.remote && remotes.find(*group.remote) == remotes.end()) {
            throw ConfigurationError("Remote '" + *group.remote + "' not defined");
        }
    }

    if (sources.empty()) {
        throw ConfigurationError("No sources configured");
    }

    for (const auto& source : sources) {
        if (source.datasets.empty()) {
            throw ConfigurationError("Source '" + source.name + "' has no datasets");
        }
        if (source.targets.empty()) {
            throw ConfigurationError("Source '" + source.name + "' has no targets");
        }
        for (const auto& target : source.targets) {
            if (target_groups.find(target) == target_groups.end()) {
                throw ConfigurationError("TargetGroup '" + target + "' not defined");
            }
        }
        for (const auto& dataset : source.datasets) {
            if (dataset.find('@') != std::string::npos) {
                throw ConfigurationError("Source dataset '" + dataset +
                                         "' contains '@', sources must not aim at snapshots");
            }
        }
        for (const auto* patterns : {&source.include, &source.exclude}) {
            for (const auto& pattern : *patterns) {
                try {
                    std::regex compiled(pattern);
                } catch (const std::regex_error& e) {
                    throw ConfigurationError("Invalid pattern '" + pattern + "' in source '" +
                                             source.name + "': " + e.what());
                }
            }
        }
    }
}

const TargetGroupConfig& Configuration::targetGroup(const std::string& name) const {
    auto it = target_groups.find(name);
    if (it == target_groups.end()) {
        throw ConfigurationError("TargetGroup '" + name + "' not defined");
    }
    return it->second;
}

std::optional<RemoteHost> Configuration::remoteFor(const TargetGroupConfig& group) const {
    if (!group.remote) {
        return std::nullopt;
    }
    auto it = remotes.find(*group.remote);
    if (it == remotes.end()) {
        throw ConfigurationError("Remote '" + *group.remote + "' not defined");
    }
    return it->second;
}
