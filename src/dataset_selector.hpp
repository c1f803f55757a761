//
// Created by garrett on 2/25/25.
//

#ifndef DATASET_SELECTOR_HPP
#define DATASET_SELECTOR_HPP

#include "configuration.hpp"
#include "snapshot_provider.hpp"

#include <regex>
#include <string>
#include <vector>

// Resolves a configured source into concrete dataset paths
class DatasetSelector {
public:
    explicit DatasetSelector(SnapshotProvider& provider);

    /// @brief Datasets of one root: root first, then descendants in lexicographic order,
    /// filtered by include/exclude (exclude wins). The root is filtered like any descendant.
    /// @throws ConfigurationError if the root does not exist or a pattern is invalid
    std::vector<std::string> select(const std::string& root, const SourceConfig& source) const;

    /// @brief All roots of a source, optionally narrowed to paths starting with prefix
    std::vector<std::string> select(const SourceConfig& source, const std::string& prefix = "") const;

    static bool matches(const std::string& path,
                        const std::vector<std::regex>& include,
                        const std::vector<std::regex>& exclude);

private:
    SnapshotProvider& m_provider;

    static std::vector<std::regex> compile(const std::vector<std::string>& patterns);
};

#endif // DATASET_SELECTOR_HPP
