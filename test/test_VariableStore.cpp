#include "envtpl/VariableStore.hpp"

#include "test_utils.h"

#include <array>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace envtpl::test {

class VariableStoreTest : public ::testing::Test {
protected:
  TempDir       dir_;
  VariableStore store_;
};

TEST_F(VariableStoreTest, SetAndLookup) {
  store_.set("HOST", "localhost");
  EXPECT_EQ(store_.lookup("HOST"), "localhost");
  EXPECT_FALSE(store_.lookup("host").has_value());
  EXPECT_FALSE(store_.lookup("PORT").has_value());
}

TEST_F(VariableStoreTest, LaterSetWins) {
  store_.set("A", "1");
  store_.set("A", "2");
  EXPECT_EQ(store_.lookup("A"), "2");
  EXPECT_EQ(store_.size(), 1);
}

TEST_F(VariableStoreTest, EmptyValueIsStillSet) {
  store_.set("EMPTY", "");
  ASSERT_TRUE(store_.lookup("EMPTY").has_value());
  EXPECT_EQ(*store_.lookup("EMPTY"), "");
}

TEST_F(VariableStoreTest, AssignUppercasesName) {
  ASSERT_TRUE(store_.assign("db_host=db.internal"));
  EXPECT_EQ(store_.lookup("DB_HOST"), "db.internal");
  EXPECT_FALSE(store_.contains("db_host"));
}

TEST_F(VariableStoreTest, AssignKeepsEverythingAfterFirstEquals) {
  ASSERT_TRUE(store_.assign("URL=http://x/?a=b&c=d"));
  EXPECT_EQ(store_.lookup("URL"), "http://x/?a=b&c=d");
}

TEST_F(VariableStoreTest, AssignRejectsMalformed) {
  auto no_equals = store_.assign("JUSTNAME");
  ASSERT_FALSE(no_equals);
  EXPECT_EQ(no_equals.error().kind(), Error::Kind::Config);

  auto no_name = store_.assign("=value");
  ASSERT_FALSE(no_name);
  EXPECT_EQ(no_name.error().kind(), Error::Kind::Config);
}

TEST_F(VariableStoreTest, FileSkipsBlankAndCommentLines) {
  write_file(
      dir_ / "vars.env",
      "# database\n"
      "\n"
      "   # indented comment\n"
      "DB_HOST=db.internal\n"
      "  DB_PORT = 5432\n"
      "GREETING=hello world # not a comment\n"
  );

  ASSERT_TRUE(store_.setFromFile(dir_ / "vars.env", true));
  EXPECT_EQ(store_.lookup("DB_HOST"), "db.internal");
  EXPECT_EQ(store_.lookup("DB_PORT"), " 5432");
  EXPECT_EQ(store_.lookup("GREETING"), "hello world # not a comment");
  EXPECT_EQ(store_.size(), 3);
}

TEST_F(VariableStoreTest, FileHandlesCrlfAndMissingTrailingNewline) {
  write_file(dir_ / "vars.env", "A=1\r\nB=2");
  ASSERT_TRUE(store_.setFromFile(dir_ / "vars.env", true));
  EXPECT_EQ(store_.lookup("A"), "1");
  EXPECT_EQ(store_.lookup("B"), "2");
}

TEST_F(VariableStoreTest, FileLaterLineWins) {
  write_file(dir_ / "vars.env", "A=first\nA=second\n");
  ASSERT_TRUE(store_.setFromFile(dir_ / "vars.env", true));
  EXPECT_EQ(store_.lookup("A"), "second");
}

TEST_F(VariableStoreTest, FileLineWithoutEqualsIsError) {
  write_file(dir_ / "vars.env", "A=1\nBROKEN\n");
  auto result = store_.setFromFile(dir_ / "vars.env", true);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::Config);
  EXPECT_NE(result.error().message().find(":2:"), std::string::npos);
}

TEST_F(VariableStoreTest, MissingMandatoryFile) {
  auto result = store_.setFromFile(dir_ / "absent.env", true);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::Config);
  EXPECT_NE(result.error().message().find("absent.env"), std::string::npos);
}

TEST_F(VariableStoreTest, MissingOptionalFileIsIgnored) {
  EXPECT_TRUE(store_.setFromFile(dir_ / "absent.env", false));
  EXPECT_EQ(store_.size(), 0);
}

TEST_F(VariableStoreTest, Environment) {
  std::array<char const*, 5> envp{"HOME=/home/user", "EMPTY=", "WEIRD=a=b", "=nameless", nullptr};
  store_.setFromEnvironment(envp.data());
  EXPECT_EQ(store_.lookup("HOME"), "/home/user");
  EXPECT_EQ(store_.lookup("EMPTY"), "");
  EXPECT_EQ(store_.lookup("WEIRD"), "a=b");
  EXPECT_EQ(store_.size(), 3);
}

TEST_F(VariableStoreTest, NullEnvironmentIsEmpty) {
  store_.setFromEnvironment(nullptr);
  EXPECT_EQ(store_.size(), 0);
}

TEST_F(VariableStoreTest, ApplyFollowsDeclarationOrder) {
  write_file(dir_ / "a.env", "COLOR=file\nSIZE=file\n");

  std::vector<VariableSource> sources{
      VariableSource::assignment("color=inline"),
      VariableSource::file((dir_ / "a.env").string()),
      VariableSource::assignment("size=inline"),
  };
  ASSERT_TRUE(store_.apply(sources));
  EXPECT_EQ(store_.lookup("COLOR"), "file");
  EXPECT_EQ(store_.lookup("SIZE"), "inline");
}

TEST_F(VariableStoreTest, ApplyOverridesEnvironment) {
  std::array<char const*, 2> envp{"USER=ambient", nullptr};
  store_.setFromEnvironment(envp.data());

  std::vector<VariableSource> sources{VariableSource::assignment("USER=explicit")};
  ASSERT_TRUE(store_.apply(sources));
  EXPECT_EQ(store_.lookup("USER"), "explicit");
}

TEST_F(VariableStoreTest, ApplyStopsAtFirstError) {
  std::vector<VariableSource> sources{
      VariableSource::assignment("A=1"),
      VariableSource::file((dir_ / "absent.env").string()),
      VariableSource::assignment("B=2"),
  };
  auto result = store_.apply(sources);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().kind(), Error::Kind::Config);
  EXPECT_TRUE(store_.contains("A"));
  EXPECT_FALSE(store_.contains("B"));
}

} // namespace envtpl::test
