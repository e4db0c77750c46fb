#include "dynalias/Template.hpp"

#include <map>
#include <gtest/gtest.h>

using namespace dynalias;

namespace {

class TemplateTest : public ::testing::Test {
protected:
  std::map<std::string, Rows> sources_{
      {"envs",
       {Row{{"name", "dev"}, {"url", "u1"}, {"port", 8080}}, Row{{"name", "prod"}, {"url", "u2"}, {"port", 443}}}},
      {"empty", {}},
  };
  std::map<std::string, std::string> locals_{{"region", "eu-west-1"}};
  std::vector<std::string>           lookups_;

  SourceLookup source_lookup() {
    return [this](std::string const& name) -> Rows const& {
      lookups_.push_back(name);
      static Rows const none;
      auto              it = sources_.find(name);
      return it == sources_.end() ? none : it->second;
    };
  }

  LocalsLookup locals_lookup() {
    return [this](std::string const& key) -> std::optional<std::string> {
      auto it = locals_.find(key);
      if (it == locals_.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }
};

} // namespace

TEST(TemplateGrammar, ParseAppVar) {
  EXPECT_EQ(parse_app_var("$${envs.name}"), (AppVarRef{"envs", std::nullopt, "name"}));
  EXPECT_EQ(parse_app_var("$${envs[1].url}"), (AppVarRef{"envs", 1, "url"}));
  EXPECT_FALSE(parse_app_var("${envs.name}").has_value());
  EXPECT_FALSE(parse_app_var("$${envs}").has_value());
  EXPECT_FALSE(parse_app_var("$${envs[].url}").has_value());
  EXPECT_FALSE(parse_app_var("$${envs.name}x").has_value());
  EXPECT_FALSE(parse_app_var("x$${envs.name}").has_value());
  EXPECT_FALSE(parse_app_var("$${env-s.name}").has_value());
}

TEST(TemplateGrammar, ParseUserVar) {
  EXPECT_EQ(parse_user_var("${db}"), "db");
  EXPECT_EQ(parse_user_var("${db_name2}"), "db_name2");
  EXPECT_FALSE(parse_user_var("$${db}").has_value());
  EXPECT_FALSE(parse_user_var("${}").has_value());
  EXPECT_FALSE(parse_user_var("${a.b}").has_value());
  EXPECT_FALSE(parse_user_var("db").has_value());
}

TEST(TemplateGrammar, ExtractAppVarsDeduplicates) {
  auto refs = extract_app_vars("curl $${a.url}:$${b[2].port}/$${a.url} ${user} $${broken");
  ASSERT_EQ(refs.size(), 2U);
  EXPECT_EQ(refs[0], (AppVarRef{"a", std::nullopt, "url"}));
  EXPECT_EQ(refs[1], (AppVarRef{"b", 2, "port"}));
}

TEST_F(TemplateTest, DirectModeDefaultsToFirstRow) {
  EXPECT_EQ(resolve_app_vars("open $${envs.url}", source_lookup()), "open u1");
}

TEST_F(TemplateTest, DirectModeExplicitIndex) {
  EXPECT_EQ(resolve_app_vars("open $${envs[1].url}:$${envs[1].port}", source_lookup()), "open u2:443");
}

TEST_F(TemplateTest, OutOfBoundsIndexLeavesPlaceholder) {
  EXPECT_EQ(resolve_app_vars("x $${envs[5].url}", source_lookup()), "x $${envs[5].url}");
}

TEST_F(TemplateTest, UnknownKeyOrSourceLeavesPlaceholder) {
  EXPECT_EQ(resolve_app_vars("$${envs.missing}", source_lookup()), "$${envs.missing}");
  EXPECT_EQ(resolve_app_vars("$${empty.x}", source_lookup()), "$${empty.x}");
  EXPECT_EQ(resolve_app_vars("$${nope.x}", source_lookup()), "$${nope.x}");
}

TEST_F(TemplateTest, ListModeReusesBoundRow) {
  Variables vars{{"envs", sources_["envs"][1]}};
  EXPECT_EQ(resolve_app_vars("connect $${envs.url}", source_lookup(), vars), "connect u2");
  EXPECT_TRUE(lookups_.empty());
}

TEST_F(TemplateTest, ExplicitIndexOverridesBoundRow) {
  Variables vars{{"envs", sources_["envs"][1]}};
  EXPECT_EQ(resolve_app_vars("$${envs[0].url}", source_lookup(), vars), "u1");
}

TEST_F(TemplateTest, ListModeMissingKeyLeavesPlaceholder) {
  Variables vars{{"envs", sources_["envs"][0]}};
  EXPECT_EQ(resolve_app_vars("$${envs.nothing}", source_lookup(), vars), "$${envs.nothing}");
}

TEST_F(TemplateTest, LocalsTakePriority) {
  sources_["locals"] = {Row{{"region", "from-source"}}};
  EXPECT_EQ(resolve_app_vars("aws --region $${locals.region}", source_lookup(), {}, locals_lookup()), "aws --region eu-west-1");
  EXPECT_EQ(resolve_app_vars("$${locals.unset}", source_lookup(), {}, locals_lookup()), "$${locals.unset}");
}

TEST_F(TemplateTest, NonStringValuesAreRenderedAsJson) {
  EXPECT_EQ(resolve_app_vars("port=$${envs.port}", source_lookup()), "port=8080");
}

TEST_F(TemplateTest, UserVars) {
  Variables vars{{"db", std::string("orders")}, {"envs", sources_["envs"][0]}};
  EXPECT_EQ(resolve_user_vars("psql ${db} ${missing}", vars), "psql orders ${missing}");
  // A bound row is not a user variable.
  EXPECT_EQ(resolve_user_vars("${envs}", vars), "${envs}");
}

TEST_F(TemplateTest, UserVarsLeaveAppVarsAlone) {
  Variables vars{{"db", std::string("orders")}};
  EXPECT_EQ(resolve_user_vars("$${envs.url} ${db} $$ $", vars), "$${envs.url} orders $$ $");
}

TEST(TemplateGrammar, DisplayValue) {
  EXPECT_EQ(display_value("text"), "text");
  EXPECT_EQ(display_value(42), "42");
  EXPECT_EQ(display_value(true), "true");
  EXPECT_EQ(display_value(nlohmann::json::array({1, 2})), "[1,2]");
}
