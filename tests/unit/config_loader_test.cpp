#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using walship::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "walship_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestCoordinatedConfigParses() {
  const auto yaml_path = WriteYaml("coordinated",
                                   R"(mount_dir: /mnt/walship
data_dir: /var/lib/walship
exec: "myapp -addr :8080"
server:
  bind_address: "0.0.0.0:20202"
coordinated:
  hostname: db-1
  advertise_url: "http://db-1:20202"
  ttl: "10s"
  lock_delay: "5s"
  postgres:
    connection_uri: "postgres://walship@localhost/walship"
retention:
  duration: "1800s"
  max_frames: 1000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.mount_dir() == "/mnt/walship");
  assert(config.exec() == "myapp -addr :8080");
  assert(config.has_coordinated());
  assert(!config.has_static_());
  assert(config.coordinated().ttl().seconds() == 10);
  assert(config.coordinated().lock_delay().seconds() == 5);
  assert(config.coordinated().has_postgres());
  assert(config.retention().duration().seconds() == 30 * 60);
  assert(config.retention().max_frames() == 1000);
  assert(!config.has_candidate());
}

void TestStaticConfigParses() {
  auto config = ConfigLoader::LoadFromString(R"(mount_dir: /mnt/walship
data_dir: /var/lib/walship
candidate: false
static:
  primary: false
  hostname: db-1
  advertise_url: "http://db-1:20202"
)");

  assert(config.has_static_());
  assert(!config.static_().primary());
  assert(config.static_().advertise_url() == "http://db-1:20202");
  assert(config.has_candidate());
  assert(!config.candidate());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromString(R"(storage:
  sqlite:
    path: "C:\\walship\\\"quoted\"\\db.sqlite"
)");
  assert(config.storage().sqlite().path() == "C:\\walship\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(coordinated:
  hostname: "1234"
)");
  assert(config.coordinated().hostname() == "1234");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString(R"(mount_dir: /mnt/walship
unknown_field: 123
)");
  } catch (const walship::util::ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEnvironmentExpansion() {
  ::setenv("WALSHIP_TEST_HOST", "db-7", 1);
  ::unsetenv("WALSHIP_TEST_UNSET");

  assert(walship::config::ExpandEnv("$WALSHIP_TEST_HOST:20202") == "db-7:20202");
  assert(walship::config::ExpandEnv("http://${WALSHIP_TEST_HOST}:1") == "http://db-7:1");
  assert(walship::config::ExpandEnv("a${WALSHIP_TEST_UNSET}b") == "ab");
  assert(walship::config::ExpandEnv("cost: 5$") == "cost: 5$");

  const std::string yaml = R"(coordinated:
  hostname: "${WALSHIP_TEST_HOST}"
)";
  assert(ConfigLoader::LoadFromString(yaml).coordinated().hostname() == "db-7");
  assert(ConfigLoader::LoadFromString(yaml, false).coordinated().hostname() == "${WALSHIP_TEST_HOST}");
}

void TestDefaults() {
  auto config = ConfigLoader::LoadFromString(R"(mount_dir: /mnt/walship
data_dir: /var/lib/walship
coordinated:
  hostname: db-1
  ttl: "8s"
)");
  ConfigLoader::ApplyDefaults(config);

  assert(config.candidate());
  assert(config.server().bind_address() == "0.0.0.0:20202");
  assert(config.coordinated().key() == "walship/primary");
  assert(config.coordinated().ttl().seconds() == 8);
  assert(config.coordinated().lock_delay().seconds() == 5);
  assert(config.coordinated().renew_interval().seconds() == 4);
  assert(config.coordinated().has_memory());
  assert(config.retention().duration().seconds() == 600);
  assert(config.retention().monitor_interval().seconds() == 60);
  assert(config.replication().reconnect_backoff_min().nanos() == 100'000'000);
  assert(config.replication().max_batch_frames() == 64);
  assert(config.storage().sqlite().path() == "/var/lib/walship/walship.db");
  assert(config.storage().sqlite().busy_timeout().seconds() == 5);
  assert(config.storage().sqlite().synchronous() == "FULL");
}

void TestExplicitPathMustExist() {
  bool threw = false;
  try {
    (void)ConfigLoader::Load(std::string("/nonexistent/walship.yml"), true);
  } catch (const walship::util::ConfigError&) {
    threw = true;
  }
  assert(threw);

  const auto  path = WriteYaml("explicit", "mount_dir: /mnt/x\n");
  std::string used;
  auto        config = ConfigLoader::Load(path.string(), true, &used);
  assert(used == path.string());
  assert(config.mount_dir() == "/mnt/x");
}

} // namespace

int main() {
  TestCoordinatedConfigParses();
  TestStaticConfigParses();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestEnvironmentExpansion();
  TestDefaults();
  TestExplicitPathMustExist();

  std::cout << "walship_unit_config_loader: pass\n";
  return 0;
}
