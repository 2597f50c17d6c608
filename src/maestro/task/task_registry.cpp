#include "maestro/task/task_registry.hpp"

#include "maestro/util/log.hpp"

namespace maestro {

TaskRegistry::TaskRegistry(std::size_t max_tasks) : max_tasks_(max_tasks) {
}

auto TaskRegistry::create_task(std::string objective) -> Result<TaskId> {
  auto entry = std::make_shared<Entry>();
  auto& task = entry->task;
  task.id = generate_task_id();
  task.objective = std::move(objective);
  task.created_at = Clock::now();
  task.updated_at = task.created_at;

  auto id = task.id;
  {
    std::unique_lock lock(index_mu_);
    if (index_.size() >= max_tasks_) {
      log::warn("Task registry full ({} tasks)", max_tasks_);
      return fail(Error::ResourceExhausted);
    }
    index_.emplace(id, std::move(entry));
  }
  log::debug("Task {} created", id);
  return id;
}

auto TaskRegistry::get(const TaskId& id) const -> Result<Task> {
  auto entry = find(id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  std::lock_guard lock(entry->mu);
  return entry->task;
}

auto TaskRegistry::list(const TaskFilter& filter) const
    -> std::vector<TaskId> {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock lock(index_mu_);
    entries.reserve(index_.size());
    for (const auto& [_, entry] : index_) {
      entries.push_back(entry);
    }
  }

  std::vector<TaskId> ids;
  for (const auto& entry : entries) {
    std::lock_guard lock(entry->mu);
    if (filter.matches(entry->task)) {
      ids.push_back(entry->task.id);
    }
  }
  return ids;
}

auto TaskRegistry::remove(const TaskId& id) -> Result<void> {
  std::unique_lock index_lock(index_mu_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return fail(Error::NotFound);
  }
  {
    std::lock_guard lock(it->second->mu);
    if (!it->second->task.terminal()) {
      return fail(Error::InvalidTransition);
    }
  }
  index_.erase(it);
  log::debug("Task {} removed", id);
  return ok();
}

auto TaskRegistry::size() const -> std::size_t {
  std::shared_lock lock(index_mu_);
  return index_.size();
}

auto TaskRegistry::find(const TaskId& id) const -> std::shared_ptr<Entry> {
  std::shared_lock lock(index_mu_);
  auto it = index_.find(id);
  return it != index_.end() ? it->second : nullptr;
}

auto TaskRegistry::erase(const TaskId& id) -> void {
  std::unique_lock lock(index_mu_);
  index_.erase(id);
}

}  // namespace maestro
