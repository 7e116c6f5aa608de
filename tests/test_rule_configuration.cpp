#include <gtest/gtest.h>
#include <core/rule_configuration.hpp>

static RemotePath file(const std::string& p) { return RemotePath(p, RemoteEntryKind::File); }

TEST(RuleConfiguration, ExcludeIsCaseInsensitivePrefix) {
    RuleConfiguration rules;
    rules.excludes = {"/site/Logs"};

    EXPECT_TRUE(rules.is_excluded(file("/site/logs/today.txt")));
    EXPECT_TRUE(rules.is_excluded(file("/SITE/LOGS")));
    // Plain string prefix: no segment boundary
    EXPECT_TRUE(rules.is_excluded(file("/site/logs-archive/x")));
    EXPECT_FALSE(rules.is_excluded(file("/site/log")));
}

TEST(RuleConfiguration, EmptyPrefixIsIgnored) {
    RuleConfiguration rules;
    rules.excludes = {""};
    EXPECT_FALSE(rules.is_excluded(file("/a.txt")));
}

TEST(RuleConfiguration, AppDataOnlyWhenEnabled) {
    RuleConfiguration rules;
    RemotePath db = file("/site/App_Data/db.mdf");

    EXPECT_FALSE(rules.is_app_data(db));
    EXPECT_FALSE(rules.keeps(db));

    rules.app_data_skip_enabled = true;
    EXPECT_TRUE(rules.is_app_data(db));
    EXPECT_TRUE(rules.keeps(db));
}

TEST(RuleConfiguration, CustomAppDataDirectory) {
    RuleConfiguration rules;
    rules.app_data_skip_enabled = true;
    rules.app_data_directory = "uploads";

    EXPECT_TRUE(rules.keeps(file("/site/Uploads/photo.jpg")));
    EXPECT_FALSE(rules.keeps(file("/site/App_Data/db.mdf")));
}
