#include <spdlog/spdlog.h>

#include <algorithm>

#include "claire/tool/tool.hpp"

namespace claire {

ToolRegistry &ToolRegistry::instance() {
  static ToolRegistry instance;
  return instance;
}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  if (!tool) return;

  std::lock_guard lock(mutex_);
  auto id = tool->id();
  auto [it, inserted] = tools_.insert_or_assign(id, std::move(tool));
  if (inserted) {
    order_.push_back(id);
    spdlog::debug("[ToolRegistry] Registered tool: {}", id);
  } else {
    spdlog::debug("[ToolRegistry] Replaced tool: {}", id);
  }
}

bool ToolRegistry::unregister_tool(const std::string &id) {
  std::lock_guard lock(mutex_);
  if (tools_.erase(id) == 0) {
    return false;
  }
  order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
  spdlog::debug("[ToolRegistry] Unregistered tool: {}", id);
  return true;
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string &id) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(id);
  if (it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

bool ToolRegistry::contains(const std::string &id) const {
  std::lock_guard lock(mutex_);
  return tools_.count(id) > 0;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::list(const std::optional<std::string> &category) const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(order_.size());
  for (const auto &id : order_) {
    const auto &tool = tools_.at(id);
    if (category && tool->category() != category) {
      continue;
    }
    result.push_back(tool);
  }
  return result;
}

std::vector<ToolId> ToolRegistry::names() const {
  std::lock_guard lock(mutex_);
  return order_;
}

size_t ToolRegistry::size() const {
  std::lock_guard lock(mutex_);
  return order_.size();
}

bool ToolRegistry::empty() const {
  return size() == 0;
}

void ToolRegistry::clear() {
  std::lock_guard lock(mutex_);
  tools_.clear();
  order_.clear();
}

}  // namespace claire
