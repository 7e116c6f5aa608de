#include <gtest/gtest.h>
#include <core/remote_path.hpp>
#include <algorithm>
#include <stdexcept>
#include <vector>

static RemotePath dir(const std::string& p) { return RemotePath(p, RemoteEntryKind::Directory); }
static RemotePath file(const std::string& p) { return RemotePath(p, RemoteEntryKind::File); }

TEST(RemotePath, NormalizesSeparators) {
    EXPECT_EQ(dir("site\\bin//x/").path(), "/site/bin/x");
    EXPECT_EQ(dir("/").path(), "/");
    EXPECT_EQ(dir("//").path(), "/");
    EXPECT_EQ(file("a.txt").path(), "/a.txt");
}

TEST(RemotePath, RejectsBlank) {
    EXPECT_THROW(dir(""), std::invalid_argument);
    EXPECT_THROW(file("   "), std::invalid_argument);
}

TEST(RemotePath, ContainsOnSeparatorBoundary) {
    EXPECT_TRUE(dir("/app").contains(file("/app/sub/x")));
    EXPECT_FALSE(dir("/app").contains(file("/application/x")));
    EXPECT_FALSE(dir("/app").contains(dir("/app")));
    EXPECT_FALSE(dir("/app/sub").contains(dir("/app")));
}

TEST(RemotePath, RootContainsEverythingButItself) {
    EXPECT_TRUE(RemotePath::root().contains(file("/a.txt")));
    EXPECT_TRUE(RemotePath::root().contains(dir("/a/b")));
    EXPECT_FALSE(RemotePath::root().contains(RemotePath::root()));
}

TEST(RemotePath, CaseInsensitiveComparison) {
    EXPECT_EQ(file("/Site/Index.HTML"), file("/site/index.html"));
    EXPECT_TRUE(dir("/APP").contains(file("/app/x")));
    EXPECT_NE(file("/a"), dir("/a"));
}

TEST(RemotePath, AppendTakesChildKind) {
    RemotePath p = dir("/site").append(file("css/main.css"));
    EXPECT_EQ(p.path(), "/site/css/main.css");
    EXPECT_TRUE(p.is_file());

    RemotePath from_root = RemotePath::root().append(dir("bin"));
    EXPECT_EQ(from_root.path(), "/bin");
    EXPECT_TRUE(from_root.is_directory());
}

TEST(RemotePath, RelativeTo) {
    EXPECT_EQ(file("/site/sub/b.txt").relative_to(dir("/site")), "sub/b.txt");
    EXPECT_EQ(file("/a.txt").relative_to(RemotePath::root()), "a.txt");
    EXPECT_EQ(file("/other/a.txt").relative_to(dir("/site")), "other/a.txt");
}

TEST(RemotePath, AppDataMatchesWholeSegment) {
    EXPECT_TRUE(file("/site/App_Data/db.mdf").is_app_data("App_Data"));
    EXPECT_TRUE(dir("/site/app_data").is_app_data("App_Data"));
    EXPECT_FALSE(file("/site/App_Data_old/db.mdf").is_app_data("App_Data"));
    EXPECT_FALSE(file("/site/App_Data.txt").is_app_data("App_Data"));
    EXPECT_FALSE(file("/site/x").is_app_data(""));
}

TEST(RemotePath, Name) {
    EXPECT_EQ(file("/site/sub/b.txt").name(), "b.txt");
    EXPECT_EQ(RemotePath::root().name(), "");
}

TEST(RemotePath, DescendingOrderPutsChildrenFirst) {
    std::vector<RemotePath> dirs = {dir("/a"), dir("/a-c"), dir("/a/b/c"), dir("/a/b")};
    std::sort(dirs.begin(), dirs.end(), [](const RemotePath& x, const RemotePath& y) { return y < x; });

    auto pos = [&](const std::string& p) {
        return std::find(dirs.begin(), dirs.end(), dir(p)) - dirs.begin();
    };
    EXPECT_LT(pos("/a/b/c"), pos("/a/b"));
    EXPECT_LT(pos("/a/b"), pos("/a"));
}

TEST(RemotePath, RejectsParentSegments) {
    EXPECT_THROW(file("/site/../shared/c.txt"), std::invalid_argument);
    EXPECT_THROW(dir(".."), std::invalid_argument);
    EXPECT_THROW(dir("/site/.."), std::invalid_argument);
    EXPECT_EQ(file("/site/..hidden").path(), "/site/..hidden");
    EXPECT_EQ(file("/site/a..b").path(), "/site/a..b");
}
