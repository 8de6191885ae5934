#include "LoginSessionRegistry.hpp"

#include "TestHeaders.hpp"

using namespace cpa;

namespace {
shared_ptr<LoginSession> makeSession(const string& id) {
  return std::make_shared<LoginSession>(id, "codex",
                                        std::make_shared<OutputClassifier>());
}
}  // namespace

TEST_CASE("Registry stores sessions by id", "[LoginSessionRegistry]") {
  LoginSessionRegistry registry;
  auto first = makeSession("aaaa0001");
  REQUIRE(registry.create("aaaa0001", first));
  REQUIRE(registry.create("aaaa0002", makeSession("aaaa0002")));
  REQUIRE(registry.size() == 2);
  REQUIRE(registry.get("aaaa0001") == first);
  REQUIRE(registry.get("missing") == nullptr);

  auto ids = registry.ids();
  std::sort(ids.begin(), ids.end());
  REQUIRE(ids == vector<string>({"aaaa0001", "aaaa0002"}));
}

TEST_CASE("Registry refuses duplicate ids", "[LoginSessionRegistry]") {
  LoginSessionRegistry registry;
  auto first = makeSession("dup00001");
  REQUIRE(registry.create("dup00001", first));
  REQUIRE(!registry.create("dup00001", makeSession("dup00001")));
  REQUIRE(registry.get("dup00001") == first);
  REQUIRE(registry.size() == 1);
}

TEST_CASE("Removing a session does not stop it", "[LoginSessionRegistry]") {
  LoginSessionRegistry registry;
  auto session = makeSession("rem00001");
  REQUIRE(registry.create("rem00001", session));

  REQUIRE(registry.remove("rem00001") == session);
  REQUIRE(registry.remove("rem00001") == nullptr);
  REQUIRE(registry.get("rem00001") == nullptr);
  REQUIRE(registry.size() == 0);
  REQUIRE(!session->isCompleted());
}

TEST_CASE("Registry is safe to use from many threads",
          "[LoginSessionRegistry]") {
  LoginSessionRegistry registry;
  vector<std::thread> workers;
  for (int t = 0; t < 4; t++) {
    workers.emplace_back([&registry, t]() {
      for (int a = 0; a < 50; a++) {
        string id = to_string(t) + "-" + to_string(a);
        registry.create(id, makeSession(id));
        registry.get(id);
        if (a % 2) {
          registry.remove(id);
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  REQUIRE(registry.size() == 4 * 25);
}
