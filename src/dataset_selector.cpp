//
// Created by garrett on 2/25/25.
//

#include "dataset_selector.hpp"
#include "backup_errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

DatasetSelector::DatasetSelector(SnapshotProvider& provider) : m_provider(provider) {}

std::vector<std::string> DatasetSelector::select(const std::string& root, const SourceConfig& source) const {
    std::vector<std::string> found = m_provider.listDatasets(root, source.recursive);
    if (std::find(found.begin(), found.end(), root) == found.end()) {
        throw ConfigurationError("Dataset " + root + " of source " + source.name + " does not exist");
    }

    if (!source.recursive) {
        return {root};
    }

    auto include = compile(source.include);
    auto exclude = compile(source.exclude);

    std::vector<std::string> descendants;
    for (const auto& path : found) {
        if (path != root && path.compare(0, root.size() + 1, root + "/") == 0) {
            descendants.push_back(path);
        }
    }
    std::sort(descendants.begin(), descendants.end());

    std::vector<std::string> selected;
    if (matches(root, include, exclude)) {
        selected.push_back(root);
    }
    for (const auto& path : descendants) {
        if (matches(path, include, exclude)) {
            selected.push_back(path);
        } else {
            spdlog::debug("Dataset {} filtered out of source {}", path, source.name);
        }
    }
    return selected;
}

std::vector<std::string> DatasetSelector::select(const SourceConfig& source, const std::string& prefix) const {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& root : source.datasets) {
        for (auto& path : select(root, source)) {
            if (path.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            if (seen.insert(path).second) {
                result.push_back(std::move(path));
            }
        }
    }
    return result;
}

bool DatasetSelector::matches(const std::string& path,
                              const std::vector<std::regex>& include,
                              const std::vector<std::regex>& exclude) {
    for (const auto& pattern : exclude) {
        if (std::regex_match(path, pattern)) {
            return false;
        }
    }
    if (include.empty()) {
        return true;
    }
    for (const auto& pattern : include) {
        if (std::regex_match(path, pattern)) {
            return true;
        }
    }
    return false;
}

std::vector<std::regex> DatasetSelector::compile(const std::vector<std::string>& patterns) {
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw ConfigurationError("Invalid dataset pattern '" + pattern + "': " + e.what());
        }
    }
    return compiled;
}
