#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sdi::match {

using TimeWindow = std::pair<double, double>;  // start, end

// 2 * LCS(a, b) / (|a| + |b|), in [0, 1]. Two empty strings give 1.0.
double similarityRatio(const std::string& a, const std::string& b);

// Best candidate whose ratio against target is >= cutoff. Earlier candidates
// win ties.
std::optional<std::string> nameSimilarity(const std::vector<std::string>& candidateNames,
                                          const std::string& targetName,
                                          double cutoff = 0.6);

// Candidates in the same directory as targetPath, candidate order kept.
std::vector<std::string> filesystemProximity(const std::vector<std::string>& candidatePaths,
                                             const std::string& targetPath);

// Indices of windows whose start and end both lie within tolerance of the
// target's start and end.
std::vector<std::size_t> timeWindowOverlap(const std::vector<TimeWindow>& candidateWindows,
                                           const TimeWindow& targetWindow,
                                           double tolerance = 2.0);

// Most frequent entry. On a tie the entry that first appears earliest in
// `evidence` wins, so the result only depends on evidence order.
std::optional<std::string> majorityVote(const std::vector<std::string>& evidence);

} // namespace sdi::match
