#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/project/Project.hpp"

namespace sdi {

enum class ActionType { Convert, Navigation, Svp, Processing };

const char* toString(ActionType t);

// Lower runs first: conversion, then imports, then processing.
int priorityOf(ActionType t);

// One pending unit of pipeline work. (type, outputDestination) is unique
// across the live actions of a container.
struct Action {
  ActionType               type = ActionType::Convert;
  std::string              outputDestination;
  std::vector<std::string> inputFiles;
  std::vector<std::string> errorFiles;  // navigation import only
  std::vector<std::string> logFiles;    // navigation import only
  ProcessingStep           step = ProcessingStep::Complete;  // processing only
  std::string              text;
  bool                     isRunning = false;

  int priority() const { return priorityOf(type); }
};

// Fields updateAction may change. Unset members are left alone.
struct ActionFields {
  std::optional<std::vector<std::string>> inputFiles;
  std::optional<std::vector<std::string>> errorFiles;
  std::optional<std::vector<std::string>> logFiles;
  std::optional<ProcessingStep>           step;
  std::optional<std::string>              text;
};

nlohmann::json toJson(const Action& a);

} // namespace sdi
