#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace walship::observability {

/*
  Named status variables rendered by AdminService/Info.

  Owned by the composition root; components publish a callback that renders
  their current state as a string (usually JSON).
*/
class StatusRegistry {
 public:
  using Renderer = std::function<std::string()>;

  // Throws util::AlreadyExists if `name` is already published.
  void Publish(const std::string& name, Renderer renderer);

  void Unpublish(const std::string& name);

  std::map<std::string, std::string> Render() const;

 private:
  mutable std::mutex              mutex_;
  std::map<std::string, Renderer> vars_;
};

} // namespace walship::observability
