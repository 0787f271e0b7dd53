#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/actions/Action.hpp"
#include "core/actions/ActionEngine.hpp"

namespace sdi {

/*
  Ordered worklist of pending actions, highest priority at index 0.

  Running actions are never modified or removed by update/remove calls; those
  calls are logged and ignored.
*/
class ActionContainer {
public:
  using Observer = std::function<void()>;
  // Receives the finished action and the engine's result. Throwing keeps the
  // action queued.
  using Commit = std::function<void(const Action& action, const InstanceHandle& result)>;

  // Throws ConsistencyViolation if (type, destination) is already live.
  void addAction(Action action);
  // Returns false if there is no such action or it is running.
  bool updateAction(ActionType type, const std::string& destination, const ActionFields& fields);
  bool removeAction(ActionType type, const std::string& destination);

  // Drops actions of `type` whose destination is not listed and returns the
  // survivors with their destinations. Throws ConsistencyViolation when two
  // actions of `type` share a destination.
  std::pair<std::vector<Action>, std::vector<std::string>>
  updateActionsFromDestinationList(ActionType type, const std::vector<std::string>& destinations);

  // Runs the action at `index` through the engine, hands the result to
  // `commit` and removes the action once both succeeded. On failure the action
  // stays queued and the exception propagates.
  InstanceHandle executeAction(std::size_t index, const ActionEngine& engine, const Settings& settings,
                               const Commit& commit = Commit());

  const Action* find(ActionType type, const std::string& destination) const;
  const std::vector<Action>& actions() const { return actions_; }
  std::size_t size() const { return actions_.size(); }
  bool empty() const { return actions_.empty(); }
  void clear();

  void bindToActionUpdate(Observer observer) { observers_.push_back(std::move(observer)); }
  void notifyObservers() const;

  nlohmann::json toJson() const;

private:
  std::vector<Action>::iterator locate(ActionType type, const std::string& destination);

  std::vector<Action> actions_;
  std::vector<Observer> observers_;
};

} // namespace sdi
