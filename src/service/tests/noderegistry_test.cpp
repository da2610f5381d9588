#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "../include/errors.hpp"
#include "../include/noderegistry.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using testsupport::makeNode;
using testsupport::TempDir;

TEST(NodeRegistryTest, InsertFindAndSnapshot) {
  NodeRegistry registry;
  registry.insert(makeNode("alpha", 9200, 9300));
  registry.insert(makeNode("beta", 9201, 9301, "blue"));

  EXPECT_EQ(registry.size(), 2u);
  EXPECT_TRUE(registry.contains("alpha"));
  ASSERT_TRUE(registry.find("beta").has_value());
  EXPECT_EQ(registry.find("beta")->cluster, "blue");
  EXPECT_FALSE(registry.find("gamma").has_value());
  EXPECT_EQ(registry.snapshot().size(), 2u);
}

// Реестр сам проверяет инварианты, даже без предварительной валидации
TEST(NodeRegistryTest, InsertRejectsInvariantViolation) {
  NodeRegistry registry;
  registry.insert(makeNode("alpha", 9200, 9300));

  try {
    registry.insert(makeNode("beta", 9300, 9301));
    FAIL() << "expected ConflictError";
  } catch (const ConflictError &e) {
    EXPECT_TRUE(e.result().hasConflict(ConflictType::HttpPort));
    EXPECT_EQ(e.kind(), ErrorKind::Conflict);
  }
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_THROW(registry.insert(makeNode("alpha", 9500, 9501)), ConflictError);
}

TEST(NodeRegistryTest, ReplaceRenamesRecord) {
  NodeRegistry registry;
  registry.insert(makeNode("alpha", 9200, 9300));

  auto renamed = makeNode("omega", 9200, 9300);
  registry.replace("alpha", renamed);

  EXPECT_FALSE(registry.contains("alpha"));
  EXPECT_TRUE(registry.contains("omega"));
  EXPECT_THROW(registry.replace("missing", renamed), NodeNotFoundError);
}

TEST(NodeRegistryTest, ReplaceRejectsCollisionWithOtherNode) {
  NodeRegistry registry;
  registry.insert(makeNode("alpha", 9200, 9300));
  registry.insert(makeNode("beta", 9201, 9301));

  auto updated = *registry.find("alpha");
  updated.transportPort = 9201;
  EXPECT_THROW(registry.replace("alpha", updated), ConflictError);
  EXPECT_EQ(registry.find("alpha")->transportPort, 9300);
}

TEST(NodeRegistryTest, RemoveReportsPresence) {
  NodeRegistry registry;
  registry.insert(makeNode("alpha", 9200, 9300));

  EXPECT_TRUE(registry.remove("alpha"));
  EXPECT_FALSE(registry.remove("alpha"));
  EXPECT_EQ(registry.size(), 0u);
}

TEST(NodeRegistryTest, PersistsAndReloads) {
  TempDir dir;
  const auto file = (dir.path() / "state" / "registry.json").string();
  {
    NodeRegistry registry(file);
    registry.insert(makeNode("alpha", 9200, 9300));
    registry.insert(makeNode("beta", 9201, 9301, "blue"));
    registry.remove("alpha");
  }

  ASSERT_TRUE(fs::exists(file));
  EXPECT_FALSE(fs::exists(file + ".tmp"));

  NodeRegistry reloaded(file);
  ASSERT_EQ(reloaded.size(), 1u);
  auto beta = reloaded.find("beta");
  ASSERT_TRUE(beta.has_value());
  EXPECT_EQ(beta->httpPort, 9201);
  EXPECT_EQ(beta->cluster, "blue");
  EXPECT_EQ(beta->dataPath, "/srv/beta/data");
}

TEST(NodeRegistryTest, RejectsMalformedRegistryFile) {
  TempDir dir;
  const auto file = (dir.path() / "registry.json").string();
  std::ofstream(file) << R"({"version": 1, "nodes": []})";

  EXPECT_THROW(NodeRegistry registry(file), std::runtime_error);
}

// Запись, которую не удалось сохранить, не остаётся в памяти
TEST(NodeRegistryTest, FailedPersistLeavesStateUnchanged) {
  TempDir dir;
  const auto blocker = dir.path() / "blocker";
  std::ofstream(blocker) << "file, not a directory";

  NodeRegistry registry((blocker / "registry.json").string());
  EXPECT_THROW(registry.insert(makeNode("alpha", 9200, 9300)), FilesystemError);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(NodeRegistryTest, GroupsClustersAlphabetically) {
  NodeRegistry registry;
  registry.insert(makeNode("n3", 9202, 9302, "red"));
  registry.insert(makeNode("n1", 9200, 9300, "blue"));
  registry.insert(makeNode("n2", 9201, 9301, "red"));

  auto clusters = registry.clusters();
  ASSERT_EQ(clusters.size(), 2u);
  EXPECT_EQ(clusters[0].name, "blue");
  EXPECT_EQ(clusters[1].name, "red");
  EXPECT_EQ(clusters[1].members, (std::vector<std::string>{"n2", "n3"}));
}

TEST(NodeRegistryTest, ConcurrentInsertsKeepPortsUnique) {
  NodeRegistry registry;
  std::atomic<int> accepted{0};
  std::atomic<int> rejected{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        registry.insert(makeNode("node-" + std::to_string(i), 9200, 9300 + i));
        ++accepted;
      } catch (const ConflictError &) {
        ++rejected;
      }
    });
  }
  for (auto &t : threads) t.join();

  EXPECT_EQ(accepted.load(), 1);
  EXPECT_EQ(rejected.load(), 7);
  EXPECT_EQ(registry.size(), 1u);
}

TEST(NodeRegistryTest, VerifyReportsDriftBothWays) {
  TempDir dir;
  const auto nodesRoot = dir.path() / "nodes";
  fs::create_directories(nodesRoot / "alpha" / "config");
  fs::create_directories(nodesRoot / "alpha" / "data");
  std::ofstream(nodesRoot / "alpha" / "config" / "elasticsearch.yml") << "x";
  fs::create_directories(nodesRoot / "orphan");

  auto alpha = makeNode("alpha", 9200, 9300);
  alpha.configPath = (nodesRoot / "alpha" / "config" / "elasticsearch.yml").string();
  alpha.dataPath = (nodesRoot / "alpha" / "data").string();
  auto ghost = makeNode("ghost", 9201, 9301);
  ghost.configPath = (nodesRoot / "ghost" / "config" / "elasticsearch.yml").string();
  ghost.dataPath = (nodesRoot / "ghost" / "data").string();

  NodeRegistry registry;
  registry.insert(alpha);
  registry.insert(ghost);

  auto report = registry.verify(nodesRoot.string());
  EXPECT_FALSE(report.valid);
  ASSERT_EQ(report.issues.size(), 3u);

  registry.remove("ghost");
  fs::remove_all(nodesRoot / "orphan");
  EXPECT_TRUE(registry.verify(nodesRoot.string()).valid);
}
