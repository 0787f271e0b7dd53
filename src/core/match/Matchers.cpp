#include "Matchers.hpp"
#include <algorithm>
#include <cmath>
#include <map>

#include "core/common/Paths.hpp"

namespace sdi::match {

double similarityRatio(const std::string& a, const std::string& b) {
  const std::size_t total = a.size() + b.size();
  if (total == 0) return 1.0;
  // LCS length, two rolling rows
  std::vector<std::size_t> prev(b.size() + 1, 0), cur(b.size() + 1, 0);
  for (std::size_t i = 1; i <= a.size(); ++i) {
    for (std::size_t j = 1; j <= b.size(); ++j) {
      if (a[i - 1] == b[j - 1]) {
        cur[j] = prev[j - 1] + 1;
      } else {
        cur[j] = std::max(prev[j], cur[j - 1]);
      }
    }
    std::swap(prev, cur);
  }
  return 2.0 * static_cast<double>(prev[b.size()]) / static_cast<double>(total);
}

std::optional<std::string> nameSimilarity(const std::vector<std::string>& candidateNames,
                                          const std::string& targetName,
                                          double cutoff) {
  std::optional<std::string> best;
  double bestRatio = -1.0;
  for (const auto& name : candidateNames) {
    const double r = similarityRatio(name, targetName);
    if (r >= cutoff && r > bestRatio) {
      bestRatio = r;
      best = name;
    }
  }
  return best;
}

std::vector<std::string> filesystemProximity(const std::vector<std::string>& candidatePaths,
                                             const std::string& targetPath) {
  const std::string targetDir = paths::parentDir(targetPath);
  std::vector<std::string> out;
  for (const auto& p : candidatePaths) {
    if (paths::parentDir(p) == targetDir) out.push_back(p);
  }
  return out;
}

std::vector<std::size_t> timeWindowOverlap(const std::vector<TimeWindow>& candidateWindows,
                                           const TimeWindow& targetWindow,
                                           double tolerance) {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < candidateWindows.size(); ++i) {
    const auto& w = candidateWindows[i];
    if (std::fabs(w.first - targetWindow.first) <= tolerance &&
        std::fabs(w.second - targetWindow.second) <= tolerance) {
      out.push_back(i);
    }
  }
  return out;
}

std::optional<std::string> majorityVote(const std::vector<std::string>& evidence) {
  std::map<std::string, std::size_t> counts;
  for (const auto& e : evidence) ++counts[e];
  std::optional<std::string> winner;
  std::size_t best = 0;
  // walk in evidence order, strict > keeps the earliest on ties
  for (const auto& e : evidence) {
    const std::size_t c = counts[e];
    if (c > best) {
      best = c;
      winner = e;
    }
  }
  return winner;
}

} // namespace sdi::match
