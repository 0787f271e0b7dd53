#pragma once
#include <functional>
#include <string>
#include <vector>

#include "core/config/Settings.hpp"
#include "core/project/Project.hpp"

namespace sdi {

/*
  Callables that do the actual work behind each action type. Each receives the
  destination key and its files, returns the updated container and throws on
  failure. Conversion into a destination with no container yet creates it.
*/
struct ActionEngine {
  using ConvertFn = std::function<InstanceHandle(const std::string& destination,
                                                 const std::vector<std::string>& lineFiles,
                                                 const Settings& settings)>;
  using ImportNavigationFn = std::function<InstanceHandle(const std::string& destination,
                                                          const std::vector<std::string>& navFiles,
                                                          const std::vector<std::string>& errorFiles,
                                                          const std::vector<std::string>& logFiles,
                                                          const Settings& settings)>;
  using ImportSvpFn = std::function<InstanceHandle(const std::string& destination,
                                                   const std::vector<std::string>& svpFiles,
                                                   const Settings& settings)>;
  using ProcessFn = std::function<InstanceHandle(const std::string& destination,
                                                 ProcessingStep fromStep,
                                                 const Settings& settings)>;

  ConvertFn convert;
  ImportNavigationFn importNavigation;
  ImportSvpFn importSvp;
  ProcessFn process;
};

} // namespace sdi
