#include "internal/observability/status_registry.hpp"

#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace walship::observability {

void StatusRegistry::Publish(const std::string& name, Renderer renderer) {
  std::lock_guard lock(mutex_);
  if (!vars_.emplace(name, std::move(renderer)).second) {
    throw walship::util::AlreadyExists("status variable already published: " + name);
  }
}

void StatusRegistry::Unpublish(const std::string& name) {
  std::lock_guard lock(mutex_);
  vars_.erase(name);
}

std::map<std::string, std::string> StatusRegistry::Render() const {
  std::vector<std::pair<std::string, Renderer>> vars;
  {
    std::lock_guard lock(mutex_);
    vars.assign(vars_.begin(), vars_.end());
  }

  // renderers may take component locks; call them outside ours
  std::map<std::string, std::string> out;
  for (const auto& [name, renderer] : vars) {
    out[name] = renderer();
  }
  return out;
}

} // namespace walship::observability
