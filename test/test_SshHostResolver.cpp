#include <gtest/gtest.h>

#include "SshHostResolver.h"
#include "test_utils.h"

using testutil::block;

TEST(SshHostResolverTest, SpreadSplitsMultiPatternBlocks) {
  const auto out = SshHostResolver::spread({
      block({"a", "b"}, {{SshConfigKeyword::Port, "22"}}),
      block({"c"}),
  });

  ASSERT_EQ(out.size(), 3);
  EXPECT_EQ(out[0].patterns, QStringList{"a"});
  EXPECT_EQ(out[1].patterns, QStringList{"b"});
  EXPECT_EQ(out[2].patterns, QStringList{"c"});
  EXPECT_EQ(out[0].entries, out[1].entries);
}

TEST(SshHostResolverTest, SpreadKeepsSinglePatternBlocks) {
  const QVector<SshHostBlock> in{block({"x"}, {{SshConfigKeyword::User, "u"}})};
  const auto out = SshHostResolver::spread(in);
  ASSERT_EQ(out.size(), 1);
  EXPECT_EQ(out[0].patterns, in[0].patterns);
  EXPECT_EQ(out[0].entries, in[0].entries);
}

TEST(SshHostResolverTest, WildcardBlocksFillAndVanish) {
  const auto out = SshHostResolver::applyPatterns({
      block({"*.corp"}, {{SshConfigKeyword::User, "corp"}, {SshConfigKeyword::Port, "2200"}}),
      block({"db.corp"}, {{SshConfigKeyword::User, "dba"}}),
      block({"home"}),
  });

  ASSERT_EQ(out.size(), 2);
  EXPECT_EQ(out[0].patterns, QStringList{"db.corp"});
  EXPECT_EQ(out[0].value(SshConfigKeyword::User), QString("dba"));
  EXPECT_EQ(out[0].value(SshConfigKeyword::Port), QString("2200"));
  EXPECT_TRUE(out[1].isEmpty());
}

TEST(SshHostResolverTest, EarlierWildcardWins) {
  const auto out = SshHostResolver::applyPatterns({
      block({"web*"}, {{SshConfigKeyword::User, "first"}}),
      block({"*"}, {{SshConfigKeyword::User, "second"}, {SshConfigKeyword::Port, "1"}}),
      block({"web1"}),
  });

  ASSERT_EQ(out.size(), 1);
  EXPECT_EQ(out[0].value(SshConfigKeyword::User), QString("first"));
  EXPECT_EQ(out[0].value(SshConfigKeyword::Port), QString("1"));
}

TEST(SshHostResolverTest, WildcardInMultiPatternBlockIsSpreadFirst) {
  const auto out = SshHostResolver::applyPatterns({
      block({"alpha", "*"}, {{SshConfigKeyword::User, "shared"}}),
      block({"beta"}),
  });

  ASSERT_EQ(out.size(), 2);
  EXPECT_EQ(out[0].patterns, QStringList{"alpha"});
  EXPECT_EQ(out[1].patterns, QStringList{"beta"});
  EXPECT_EQ(out[1].value(SshConfigKeyword::User), QString("shared"));
}

TEST(SshHostResolverTest, NegatedPatternWithCatchAll) {
  const auto out = SshHostResolver::resolve({
      block({"*"}, {{SshConfigKeyword::Hostname, "example.com"}}),
      block({"!example.com"}, {{SshConfigKeyword::User, "hello"}}),
      block({"example.com"}, {{SshConfigKeyword::Port, "22"}}),
      block({"hello.com"}, {{SshConfigKeyword::Port, "22"}}),
  });

  ASSERT_EQ(out.size(), 2);

  EXPECT_EQ(out[0].patterns, QStringList{"example.com"});
  EXPECT_EQ(out[0].entries, (SshConfigEntries{{SshConfigKeyword::Hostname, "example.com"},
                                              {SshConfigKeyword::Port, "22"}}));

  EXPECT_EQ(out[1].patterns, QStringList{"hello.com"});
  EXPECT_EQ(out[1].entries, (SshConfigEntries{{SshConfigKeyword::Hostname, "example.com"},
                                              {SshConfigKeyword::User, "hello"},
                                              {SshConfigKeyword::Port, "22"}}));
}

TEST(SshHostResolverTest, HostnameDefaultsToPattern) {
  const auto out = SshHostResolver::applyNameToEmptyHostname({
      block({"bare"}),
      block({"named"}, {{SshConfigKeyword::Hostname, "10.0.0.1"}}),
  });

  ASSERT_EQ(out.size(), 2);
  EXPECT_EQ(out[0].value(SshConfigKeyword::Hostname), QString("bare"));
  EXPECT_EQ(out[1].value(SshConfigKeyword::Hostname), QString("10.0.0.1"));
}

TEST(SshHostResolverTest, EmptyHostnameDefaultsToPattern) {
  const auto out = SshHostResolver::applyNameToEmptyHostname({
      block({"blank"}, {{SshConfigKeyword::Hostname, ""}}),
  });

  ASSERT_EQ(out.size(), 1);
  EXPECT_EQ(out[0].value(SshConfigKeyword::Hostname), QString("blank"));
}

TEST(SshHostResolverTest, MergeIdenticalEntries) {
  const auto out = SshHostResolver::mergeSameHosts({
      block({"same1.com"}, {{SshConfigKeyword::Port, "22"}}),
      block({"other"}, {{SshConfigKeyword::Port, "23"}}),
      block({"same2.com"}, {{SshConfigKeyword::Port, "22"}}),
  });

  ASSERT_EQ(out.size(), 2);
  EXPECT_EQ(out[0].patterns, (QStringList{"same1.com", "same2.com"}));
  EXPECT_EQ(out[1].patterns, QStringList{"other"});
}

TEST(SshHostResolverTest, ResolveMergesSameHosts) {
  const auto out = SshHostResolver::resolve({
      block({"same1.com"}, {{SshConfigKeyword::Hostname, "h"}, {SshConfigKeyword::Port, "22"}}),
      block({"same2.com"}, {{SshConfigKeyword::Hostname, "h"}, {SshConfigKeyword::Port, "22"}}),
  });

  ASSERT_EQ(out.size(), 1);
  EXPECT_EQ(out[0].patterns, (QStringList{"same1.com", "same2.com"}));
}

TEST(SshHostResolverTest, DefaultHostnameKeepsDistinctHostsApart) {
  // Port is equal, but each host gets its own Hostname before merging.
  const auto out = SshHostResolver::resolve({
      block({"same1.com"}, {{SshConfigKeyword::Port, "22"}}),
      block({"same2.com"}, {{SshConfigKeyword::Port, "22"}}),
  });

  ASSERT_EQ(out.size(), 2);
  EXPECT_EQ(out[0].value(SshConfigKeyword::Hostname), QString("same1.com"));
  EXPECT_EQ(out[1].value(SshConfigKeyword::Hostname), QString("same2.com"));
}

TEST(SshHostResolverTest, MergeIsIdempotent) {
  const QVector<SshHostBlock> in{
      block({"a"}, {{SshConfigKeyword::Port, "1"}}),
      block({"b"}, {{SshConfigKeyword::Port, "2"}}),
      block({"c"}, {{SshConfigKeyword::Port, "1"}}),
      block({"d"}, {{SshConfigKeyword::Port, "2"}}),
      block({"e"}),
  };

  const auto once = SshHostResolver::mergeSameHosts(in);
  const auto twice = SshHostResolver::mergeSameHosts(once);

  ASSERT_EQ(once.size(), 3);
  ASSERT_EQ(twice.size(), once.size());
  for (int i = 0; i < once.size(); ++i) {
    EXPECT_EQ(twice[i].patterns, once[i].patterns);
    EXPECT_EQ(twice[i].entries, once[i].entries);
  }
}

TEST(SshHostResolverTest, InputIsNotModified) {
  const QVector<SshHostBlock> in{
      block({"*"}, {{SshConfigKeyword::User, "u"}}),
      block({"a", "b"}),
  };
  const QVector<SshHostBlock> copy = in;

  SshHostResolver::resolve(in);

  ASSERT_EQ(in.size(), copy.size());
  for (int i = 0; i < in.size(); ++i) {
    EXPECT_EQ(in[i].patterns, copy[i].patterns);
    EXPECT_EQ(in[i].entries, copy[i].entries);
  }
}

TEST(SshHostResolverTest, EmptyInput) {
  EXPECT_TRUE(SshHostResolver::resolve({}).isEmpty());
}
