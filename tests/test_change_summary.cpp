#include <gtest/gtest.h>
#include <core/change_summary.hpp>
#include <algorithm>

TEST(ChangeSummary, MergeAppendsLists) {
    ChangeSummary a;
    a.deleted_files = {"old.txt"};
    a.ignored_directories = {"App_Data"};

    ChangeSummary b;
    b.deleted_files = {"older.txt"};
    b.created_directories = {"sub"};
    b.ignored_files = {"App_Data/db.mdf"};

    a.merge(b);
    EXPECT_EQ(a.deleted_files, (std::vector<std::string>{"old.txt", "older.txt"}));
    EXPECT_EQ(a.created_directories, (std::vector<std::string>{"sub"}));
    EXPECT_EQ(a.ignored_files, (std::vector<std::string>{"App_Data/db.mdf"}));
    EXPECT_EQ(a.ignored_directories, (std::vector<std::string>{"App_Data"}));
}

TEST(ChangeSummary, MergeDropsCreatedThatWereUpdated) {
    ChangeSummary a;
    a.updated_files = {"sub/b.txt"};
    a.created_files = {"c.txt"};

    ChangeSummary b;
    b.created_files = {"a.txt", "Sub/B.txt"};
    b.updated_files = {"c.txt"};

    a.merge(b);
    EXPECT_EQ(a.created_files, (std::vector<std::string>{"a.txt"}));
    EXPECT_EQ(a.updated_files, (std::vector<std::string>{"sub/b.txt", "c.txt"}));
}

TEST(ChangeSummary, MergeIsAssociativeOverLists) {
    ChangeSummary a, b, c;
    a.created_files = {"x"};
    a.updated_files = {"y"};
    b.created_files = {"y", "z"};
    c.created_files = {"w"};
    c.updated_files = {"z"};
    c.deleted_files = {"d"};

    ChangeSummary left = a;
    left.merge(b);
    left.merge(c);

    ChangeSummary bc = b;
    bc.merge(c);
    ChangeSummary right = a;
    right.merge(bc);

    EXPECT_EQ(left.created_files, right.created_files);
    EXPECT_EQ(left.updated_files, right.updated_files);
    EXPECT_EQ(left.deleted_files, right.deleted_files);
    EXPECT_EQ(left.created_files, (std::vector<std::string>{"x", "w"}));
}

TEST(ChangeSummary, Empty) {
    ChangeSummary s;
    EXPECT_TRUE(s.empty());
    s.ignored_files.push_back("App_Data/x");
    EXPECT_FALSE(s.empty());
}

TEST(ChangeSummary, DisplayString) {
    ChangeSummary s;
    s.created_files = {"a.txt"};
    s.updated_files = {"sub/b.txt"};
    s.deleted_files = {"old.txt"};
    s.ignored_files = {"App_Data/db.mdf", "logs/x.log"};
    s.total_time = std::chrono::milliseconds(2500);

    std::string out = s.to_display_string();
    EXPECT_NE(out.find("Created files:\n* a.txt\n"), std::string::npos);
    EXPECT_NE(out.find("Updated files:\n* sub/b.txt\n"), std::string::npos);
    EXPECT_NE(out.find("Deleted files:\n* old.txt\n"), std::string::npos);
    EXPECT_NE(out.find("Ignored files: 2\n"), std::string::npos);
    EXPECT_NE(out.find("Created files: 1\n"), std::string::npos);
    EXPECT_NE(out.find("Total time: 2.5 seconds"), std::string::npos);
    EXPECT_EQ(out.find("Deleted directories:"), std::string::npos);
}
