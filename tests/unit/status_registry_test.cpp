#include "internal/observability/status_registry.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using walship::observability::StatusRegistry;

void TestRenderCallsEveryRenderer() {
  StatusRegistry registry;
  int            calls = 0;
  registry.Publish("store", [&] {
    ++calls;
    return std::string(R"({"role":"ROLE_PRIMARY"})");
  });
  registry.Publish("build", [] { return std::string("dev"); });

  auto vars = registry.Render();
  assert(vars.size() == 2);
  assert(vars.at("store") == R"({"role":"ROLE_PRIMARY"})");
  assert(vars.at("build") == "dev");

  registry.Render();
  assert(calls == 2);
}

void TestDuplicatePublishRejected() {
  StatusRegistry registry;
  registry.Publish("store", [] { return std::string("a"); });

  bool duplicate = false;
  try {
    registry.Publish("store", [] { return std::string("b"); });
  } catch (const walship::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);
  assert(registry.Render().at("store") == "a");
}

void TestUnpublish() {
  StatusRegistry registry;
  registry.Publish("store", [] { return std::string("a"); });
  registry.Unpublish("store");
  registry.Unpublish("never-published");
  assert(registry.Render().empty());

  registry.Publish("store", [] { return std::string("again"); });
  assert(registry.Render().at("store") == "again");
}

// A renderer may call back into the registry.
void TestRendererMayReenter() {
  StatusRegistry registry;
  registry.Publish("leaf", [] { return std::string("x"); });
  registry.Publish("outer", [&] {
    registry.Unpublish("leaf");
    return std::string("done");
  });

  auto vars = registry.Render();
  assert(vars.at("leaf") == "x");
  assert(vars.at("outer") == "done");
  assert(registry.Render().size() == 1);
}

} // namespace

int main() {
  TestRenderCallsEveryRenderer();
  TestDuplicatePublishRejected();
  TestUnpublish();
  TestRendererMayReenter();

  std::cout << "walship_unit_status_registry: pass\n";
  return 0;
}
