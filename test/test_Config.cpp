#include "dynalias/Config.hpp"
#include "test_utils.h"

#include <cstdlib>
#include <fstream>

#include <gtest/gtest.h>

using namespace dynalias;
using namespace dynalias::test;

TEST(ConfigTest, ParsesAllBlockKinds) {
  auto model = parse_model(R"([
    {"config": {"history-size": 50, "verbose": true}},
    {"type": "dict", "name": "envs", "data": [{"name": "dev", "port": 5432}]},
    {"type": "dynamic_dict", "name": "pods", "command": "kubectl get pods -o json",
     "mapping": {"name": "metadata_name", "ns": "namespace"}, "priority": 2, "timeout": 5, "cache-ttl": 60},
    {"type": "command", "name": "Postgres", "alias": "pg ${db}", "command": "psql ${db}",
     "helper": "Connect", "timeout": 30, "strict": true, "helper-type": "custom",
     "args": [{"alias": ["-v", "--verbose"], "command": "-e"}],
     "sub": [{"alias": "ro", "command": "--readonly", "set-locals": true}]}
  ])");
  ASSERT_TRUE(model.has_value()) << model.error();

  EXPECT_EQ(model->global_.history_size_, 50U);
  EXPECT_TRUE(model->global_.verbose_);

  ASSERT_EQ(model->statics_.size(), 1U);
  EXPECT_EQ(model->statics_[0].rows_[0]["port"], 5432);

  ASSERT_EQ(model->dynamics_.size(), 1U);
  auto const& pods = model->dynamics_[0];
  EXPECT_EQ(pods.priority_, 2);
  EXPECT_EQ(pods.timeout_, 5);
  EXPECT_EQ(pods.cache_ttl_, 60);
  ASSERT_EQ(pods.mapping_.size(), 2U);
  EXPECT_EQ(pods.mapping_[0].first, "name");
  EXPECT_EQ(pods.mapping_[1].second, "namespace");

  ASSERT_EQ(model->commands_.size(), 1U);
  auto const& pg = model->commands_[0];
  EXPECT_EQ(pg.name_, "Postgres");
  EXPECT_EQ(pg.alias(), "pg ${db}");
  EXPECT_EQ(pg.helper_, "Connect");
  EXPECT_EQ(pg.timeout_, 30);
  EXPECT_TRUE(pg.strict_);
  EXPECT_EQ(pg.helper_type_, HelperType::Custom);
  ASSERT_EQ(pg.args_.size(), 1U);
  EXPECT_EQ(pg.args_[0].kind_, NodeKind::Arg);
  EXPECT_EQ(pg.args_[0].aliases_, (std::vector<std::string>{"-v", "--verbose"}));
  ASSERT_EQ(pg.sub_.size(), 1U);
  EXPECT_EQ(pg.sub_[0].kind_, NodeKind::SubCommand);
  EXPECT_TRUE(pg.sub_[0].set_locals_);
}

TEST(ConfigTest, Defaults) {
  auto model = parse_model(R"([
    {"type": "dynamic_dict", "name": "s", "command": "c", "mapping": {"a": "b"}},
    {"type": "command", "name": "x", "alias": "x", "command": "x"}
  ])");
  ASSERT_TRUE(model.has_value()) << model.error();
  EXPECT_EQ(model->global_.history_size_, constant::DEFAULT_HISTORY_SIZE);
  EXPECT_EQ(model->dynamics_[0].priority_, constant::DEFAULT_SOURCE_PRIORITY);
  EXPECT_EQ(model->dynamics_[0].timeout_, constant::DEFAULT_SOURCE_TIMEOUT);
  EXPECT_EQ(model->dynamics_[0].cache_ttl_, constant::DEFAULT_CACHE_TTL);
  EXPECT_EQ(model->commands_[0].timeout_, 0);
  EXPECT_FALSE(model->commands_[0].strict_);
  EXPECT_EQ(model->commands_[0].helper_type_, HelperType::Auto);
}

TEST(ConfigTest, HistorySizeIsCapped) {
  auto model = parse_model(R"([{"config": {"history-size": 100000}}])");
  ASSERT_TRUE(model.has_value());
  EXPECT_EQ(model->global_.history_size_, constant::MAX_HISTORY_SIZE);
}

TEST(ConfigTest, UnknownGlobalKeysAreIgnored) {
  auto model = parse_model(R"([{"config": {"shell": true, "theme": "dark", "verbose": true}}])");
  ASSERT_TRUE(model.has_value()) << model.error();
  EXPECT_TRUE(model->global_.verbose_);
  EXPECT_EQ(model->global_.history_size_, constant::DEFAULT_HISTORY_SIZE);
}

TEST(ConfigTest, DynamicSourcesSortedByPriorityStable) {
  auto model = parse_model(R"([
    {"type": "dynamic_dict", "name": "c", "command": "c", "mapping": {}, "priority": 3},
    {"type": "dynamic_dict", "name": "a", "command": "a", "mapping": {}, "priority": 1},
    {"type": "dynamic_dict", "name": "b", "command": "b", "mapping": {}, "priority": 1}
  ])");
  ASSERT_TRUE(model.has_value()) << model.error();
  ASSERT_EQ(model->dynamics_.size(), 3U);
  EXPECT_EQ(model->dynamics_[0].name_, "a");
  EXPECT_EQ(model->dynamics_[1].name_, "b");
  EXPECT_EQ(model->dynamics_[2].name_, "c");
}

TEST(ConfigTest, UnknownBlocksAreSkipped) {
  auto model = parse_model(R"([{"type": "plugin", "name": "p"}, 42, {"type": "dict", "name": "d"}])");
  ASSERT_TRUE(model.has_value()) << model.error();
  EXPECT_EQ(model->statics_.size(), 1U);
  EXPECT_TRUE(model->statics_[0].rows_.empty());
}

TEST(ConfigTest, AcceptsByteOrderMark) {
  auto model = parse_model("\xEF\xBB\xBF[]");
  ASSERT_TRUE(model.has_value());
}

TEST(ConfigTest, RejectsMalformedDocuments) {
  EXPECT_FALSE(parse_model("not json").has_value());
  EXPECT_FALSE(parse_model(R"({"type": "dict"})").has_value());
  EXPECT_FALSE(parse_model(R"([{"type": "command", "name": "x", "command": "x"}])").has_value());
  EXPECT_FALSE(parse_model(R"([{"type": "command", "name": "x", "alias": "x"}])").has_value());
  EXPECT_FALSE(parse_model(R"([{"type": "dynamic_dict", "name": "s", "command": "c"}])").has_value());
  EXPECT_FALSE(parse_model(R"([{"type": "dict", "name": "d", "data": [1, 2]}])").has_value());
  EXPECT_FALSE(parse_model(R"([{"type": "command", "name": "x", "alias": "x", "command": "x", "helper-type": "fancy"}])")
                   .has_value());
  EXPECT_FALSE(parse_model(R"([{"type": "command", "name": "x", "alias": ["x", "y"], "command": "x"}])").has_value());
}

TEST(ConfigTest, TypeErrorsBecomeErrorsNotExceptions) {
  auto model = parse_model(R"([{"type": "command", "name": "x", "alias": "x", "command": "x", "timeout": "soon"}])");
  ASSERT_FALSE(model.has_value());
  EXPECT_NE(model.error().find("Invalid config"), std::string::npos);
}

TEST(ConfigTest, RejectsDuplicateAndReservedSourceNames) {
  auto duplicate = parse_model(R"([
    {"type": "dict", "name": "envs"},
    {"type": "dynamic_dict", "name": "envs", "command": "c", "mapping": {}}
  ])");
  ASSERT_FALSE(duplicate.has_value());
  EXPECT_NE(duplicate.error().find("duplicate"), std::string::npos);

  auto reserved = parse_model(R"([{"type": "dict", "name": "locals"}])");
  ASSERT_FALSE(reserved.has_value());
  EXPECT_NE(reserved.error().find("reserved"), std::string::npos);
}

TEST(ConfigTest, SubstitutesEnvironmentInStaticData) {
  setenv("DYNALIAS_TEST_HOST", "db.internal", 1);
  unsetenv("DYNALIAS_TEST_UNSET");

  auto model = parse_model(R"([{"type": "dict", "name": "envs", "data": [
    {"host": "$${env.DYNALIAS_TEST_HOST}:5432", "missing": "[$${env.DYNALIAS_TEST_UNSET}]"}
  ]}])");
  ASSERT_TRUE(model.has_value()) << model.error();
  EXPECT_EQ(model->statics_[0].rows_[0]["host"], "db.internal:5432");
  EXPECT_EQ(model->statics_[0].rows_[0]["missing"], "[]");
}

TEST(ConfigTest, SubstituteEnvLeavesOtherPlaceholders) {
  EXPECT_EQ(substitute_env("$${envs.url} ${x} $${env.}"), "$${envs.url} ${x} $${env.}");
}

TEST(ConfigTest, LoadModelFromFile) {
  TempDir dir;
  {
    std::ofstream out(dir / "dya.json");
    out << R"([{"type": "command", "name": "x", "alias": "x", "command": "echo x"}])";
  }
  auto model = load_model(dir / "dya.json");
  ASSERT_TRUE(model.has_value()) << model.error();
  EXPECT_EQ(model->commands_.size(), 1U);

  auto missing = load_model(dir / "nope.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_NE(missing.error().find("Config file not found"), std::string::npos);
}
