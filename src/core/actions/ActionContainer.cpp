#include "ActionContainer.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/common/Errors.hpp"

namespace sdi {

std::vector<Action>::iterator ActionContainer::locate(ActionType type, const std::string& destination) {
  return std::find_if(actions_.begin(), actions_.end(), [&](const Action& a) {
    return a.type == type && a.outputDestination == destination;
  });
}

const Action* ActionContainer::find(ActionType type, const std::string& destination) const {
  for (const auto& a : actions_) {
    if (a.type == type && a.outputDestination == destination) return &a;
  }
  return nullptr;
}

void ActionContainer::addAction(Action action) {
  if (locate(action.type, action.outputDestination) != actions_.end()) {
    throw ConsistencyViolation(std::string("a ") + toString(action.type) +
                               " action already exists for destination " + action.outputDestination);
  }
  // after every action of equal or higher priority
  auto pos = std::find_if(actions_.begin(), actions_.end(), [&](const Action& a) {
    return a.priority() > action.priority();
  });
  spdlog::info("Adding {} action for {}", toString(action.type), action.outputDestination);
  actions_.insert(pos, std::move(action));
}

bool ActionContainer::updateAction(ActionType type, const std::string& destination, const ActionFields& fields) {
  auto it = locate(type, destination);
  if (it == actions_.end()) return false;
  if (it->isRunning) {
    spdlog::warn("{} action for {} is running, update ignored", toString(type), destination);
    return false;
  }
  if (fields.inputFiles) it->inputFiles = *fields.inputFiles;
  if (fields.errorFiles) it->errorFiles = *fields.errorFiles;
  if (fields.logFiles)   it->logFiles = *fields.logFiles;
  if (fields.step)       it->step = *fields.step;
  if (fields.text)       it->text = *fields.text;
  return true;
}

bool ActionContainer::removeAction(ActionType type, const std::string& destination) {
  auto it = locate(type, destination);
  if (it == actions_.end()) return false;
  if (it->isRunning) {
    spdlog::warn("{} action for {} is running, removal ignored", toString(type), destination);
    return false;
  }
  spdlog::info("Removing {} action for {}", toString(type), destination);
  actions_.erase(it);
  return true;
}

std::pair<std::vector<Action>, std::vector<std::string>>
ActionContainer::updateActionsFromDestinationList(ActionType type, const std::vector<std::string>& destinations) {
  std::map<std::string, int> seen;
  for (const auto& a : actions_) {
    if (a.type != type) continue;
    if (++seen[a.outputDestination] > 1) {
      throw ConsistencyViolation(std::string("found multiple ") + toString(type) +
                                 " actions for destination " + a.outputDestination);
    }
  }

  std::vector<std::string> stale;
  for (const auto& a : actions_) {
    if (a.type == type &&
        std::find(destinations.begin(), destinations.end(), a.outputDestination) == destinations.end()) {
      stale.push_back(a.outputDestination);
    }
  }
  for (const auto& dest : stale) removeAction(type, dest);

  std::pair<std::vector<Action>, std::vector<std::string>> current;
  for (const auto& a : actions_) {
    if (a.type != type) continue;
    current.first.push_back(a);
    current.second.push_back(a.outputDestination);
  }
  return current;
}

InstanceHandle ActionContainer::executeAction(std::size_t index, const ActionEngine& engine, const Settings& settings,
                                             const Commit& commit) {
  if (index >= actions_.size()) {
    throw std::out_of_range("no action at index " + std::to_string(index) +
                            " (" + std::to_string(actions_.size()) + " queued)");
  }
  actions_[index].isRunning = true;
  const Action action = actions_[index];
  notifyObservers();
  spdlog::info("Executing {} action for {}", toString(action.type), action.outputDestination);

  auto finish = [&](bool succeeded) {
    auto it = locate(action.type, action.outputDestination);
    if (it == actions_.end()) return;
    if (succeeded) {
      actions_.erase(it);
    } else {
      it->isRunning = false;
    }
  };

  InstanceHandle result;
  try {
    switch (action.type) {
      case ActionType::Convert:
        if (!engine.convert) throw std::runtime_error("no conversion engine configured");
        result = engine.convert(action.outputDestination, action.inputFiles, settings);
        break;
      case ActionType::Navigation:
        if (!engine.importNavigation) throw std::runtime_error("no navigation import engine configured");
        result = engine.importNavigation(action.outputDestination, action.inputFiles,
                                         action.errorFiles, action.logFiles, settings);
        break;
      case ActionType::Svp:
        if (!engine.importSvp) throw std::runtime_error("no svp import engine configured");
        result = engine.importSvp(action.outputDestination, action.inputFiles, settings);
        break;
      case ActionType::Processing:
        if (!engine.process) throw std::runtime_error("no processing engine configured");
        result = engine.process(action.outputDestination, action.step, settings);
        break;
    }
    if (commit) commit(action, result);
  } catch (const std::exception& e) {
    spdlog::error("{} action for {} failed: {}", toString(action.type), action.outputDestination, e.what());
    finish(false);
    notifyObservers();
    throw;
  }
  finish(true);
  return result;
}

void ActionContainer::clear() {
  actions_.clear();
}

void ActionContainer::notifyObservers() const {
  for (const auto& obs : observers_) obs();
}

nlohmann::json ActionContainer::toJson() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& a : actions_) out.push_back(sdi::toJson(a));
  return out;
}

} // namespace sdi
