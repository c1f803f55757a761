//
// Created by garrett on 2/25/25.
//

#ifndef SNAPSHOT_NAMING_HPP
#define SNAPSHOT_NAMING_HPP

#include "snapshot_provider.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Backup snapshots are named <prefix>_<sequence>, sequences start at 1
constexpr char SNAPSHOT_SEPARATOR = '_';
constexpr uint64_t FIRST_SEQUENCE = 1;

inline std::string formatSnapshotName(const std::string& prefix, uint64_t sequence) {
    return prefix + SNAPSHOT_SEPARATOR + std::to_string(sequence);
}

// Sequence of a snapshot name, nullopt for names that are not ours
inline std::optional<uint64_t> parseSnapshotSequence(const std::string& prefix, const std::string& name) {
    if (name.size() <= prefix.size() + 1 || name.compare(0, prefix.size(), prefix) != 0 ||
        name[prefix.size()] != SNAPSHOT_SEPARATOR) {
        return std::nullopt;
    }
    std::string digits = name.substr(prefix.size() + 1);
    if (digits.size() > 19 || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    uint64_t sequence = std::stoull(digits);
    if (sequence < FIRST_SEQUENCE) {
        return std::nullopt;
    }
    return sequence;
}

// Sorted sequences of the prefixed snapshots in the list
inline std::vector<uint64_t> snapshotSequences(const std::string& prefix, const std::vector<SnapshotInfo>& snapshots) {
    std::vector<uint64_t> sequences;
    for (const auto& snapshot : snapshots) {
        if (auto sequence = parseSnapshotSequence(prefix, snapshot.name)) {
            sequences.push_back(*sequence);
        }
    }
    std::sort(sequences.begin(), sequences.end());
    sequences.erase(std::unique(sequences.begin(), sequences.end()), sequences.end());
    return sequences;
}

#endif // SNAPSHOT_NAMING_HPP
