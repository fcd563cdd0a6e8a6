#include <gtest/gtest.h>
#include "core/IncludeSearch.hpp"
#include "MockScanners.hpp"
#include "TempTree.hpp"
#include <chrono>

using namespace companion_mcp;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

class IncludeSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        header = tree.file("a/b/x.h", "#pragma once\n");
    }

    IncludeSearch make_search(SearchScope scope = SearchScope::HEADER_DIRECTORY) {
        return IncludeSearch(PathClassifier(), std::make_shared<RecursiveContentScanner>(), scope);
    }

    std::optional<fs::path> find(SearchScope scope = SearchScope::HEADER_DIRECTORY) {
        CancellationToken token;
        return make_search(scope).find_including_source_file(header, tree.root(), token);
    }

    TempTree tree;
    fs::path header;
};

TEST_F(IncludeSearchTest, EscapeRegex) {
    EXPECT_EQ(IncludeSearch::escape_regex("a/b/x.h"), "a/b/x\\.h");
    EXPECT_EQ(IncludeSearch::escape_regex("c++/v1(x)"), "c\\+\\+/v1\\(x\\)");
    EXPECT_EQ(IncludeSearch::escape_regex("plain"), "plain");
}

TEST_F(IncludeSearchTest, PatternRecognizesDirectives) {
    std::regex re(IncludeSearch::build_include_pattern("/r/a/b/x.h", "/r"));

    EXPECT_TRUE(std::regex_search("#include <a/b/x.h>", re));
    EXPECT_TRUE(std::regex_search("  #include \"a/b/x.h\"  ", re));
    EXPECT_TRUE(std::regex_search("#import \"x.h\"", re));
    EXPECT_TRUE(std::regex_search("# include \"../../x.h\"", re));
    EXPECT_TRUE(std::regex_search("#include \"sub/dir/x.h\"", re));

    EXPECT_FALSE(std::regex_search("#include \"xx.h\"", re));
    EXPECT_FALSE(std::regex_search("#include \"a/b/x_h\"", re));
    EXPECT_FALSE(std::regex_search("// #include <a/b/x.h>", re));
    EXPECT_FALSE(std::regex_search("#include <a/b/x.h> // trailing", re));
    EXPECT_FALSE(std::regex_search("#define X \"x.h\"", re));
}

TEST_F(IncludeSearchTest, AcceptsRootRelativeInclude) {
    auto source = tree.file("a/b/impl/deep/y.cpp", "#include <a/b/x.h>\n");

    auto result = find();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, AcceptsSourceRelativeInclude) {
    auto source = tree.file("a/b/c/d/y.m", "#import <Foundation/Foundation.h>\n#include \"../../x.h\"\n");

    auto result = find();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, AcceptsBareIncludeInSameDirectory) {
    auto source = tree.file("a/b/x_impl.cpp", "#include \"x.h\"\n");

    auto result = find();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, RejectsRelativeIncludeOfAnotherHeader) {
    tree.file("a/b/c/y.m", "#include \"../wrong/x.h\"\n");
    tree.file("a/b/c/z.cpp", "#include \"x.h\"\n");

    auto result = find();

    EXPECT_FALSE(result.has_value());
}

TEST_F(IncludeSearchTest, AcceptsOnlyTheValidRelativeInclude) {
    tree.file("a/b/c/wrong.m", "#include \"../wrong/x.h\"\n");
    auto right = tree.file("a/b/c/right.m", "#include \"../x.h\"\n");

    auto result = find();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, right);
}

TEST_F(IncludeSearchTest, ProjectScopeFindsIncludesOutsideHeaderDirectory) {
    auto source = tree.file("c/d/y.m", "#include \"../../a/b/x.h\"\n");

    EXPECT_FALSE(find(SearchScope::HEADER_DIRECTORY).has_value());

    auto result = find(SearchScope::PROJECT_ROOT);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, ProjectScopeRejectsMisresolvedInclude) {
    // From c/ the path climbs above the project root
    tree.file("c/y.m", "#include \"../../a/b/x.h\"\n");

    EXPECT_FALSE(find(SearchScope::PROJECT_ROOT).has_value());
}

TEST_F(IncludeSearchTest, WithoutProjectRootBareIncludeIsResolved) {
    tree.file("a/b/c/x.h", "#pragma once\n");
    tree.file("a/b/c/z.cpp", "#include \"x.h\"\n");

    CancellationToken token;
    auto search = make_search();

    EXPECT_FALSE(search.find_including_source_file(header, std::nullopt, token).has_value());

    auto source = tree.file("a/b/x_impl.cpp", "#include \"x.h\"\n");
    auto result = search.find_including_source_file(header, std::nullopt, token);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, ProjectScopeWithoutRootSearchesHeaderDirectory) {
    auto source = tree.file("a/b/impl/y.cpp", "#include \"../x.h\"\n");
    tree.file("c/y.cpp", "#include \"../a/b/x.h\"\n");

    CancellationToken token;
    auto result = make_search(SearchScope::PROJECT_ROOT).find_including_source_file(header, std::nullopt, token);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, HugeLinesDoNotBreakTheSearch) {
    tree.file("a/b/gen.cpp", "#include \"" + std::string(1 << 20, 'a') + "\n");
    tree.file("a/b/padded.cpp", std::string(100000, ' ') + "x\n");
    tree.file("a/b/long_path.cpp", "#include \"" + std::string(1 << 20, 'd') + "/x.h\"\n");
    auto source = tree.file("a/b/impl/y.cpp", "#include <a/b/x.h>\n");

    auto result = find();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, AcceptMatchOnlyMatchesShortDirectives) {
    auto search = make_search();
    auto file = tree.root() / "a/b/y.cpp";
    std::regex re(IncludeSearch::build_include_pattern(header, tree.root()));

    EXPECT_TRUE(search.accept_match(file, "    #include \"x.h\"", header, re));
    EXPECT_FALSE(search.accept_match(file, "#include \"" + std::string(1 << 20, 'd') + "/x.h\"", header, re));
    EXPECT_FALSE(search.accept_match(file, std::string(1 << 20, ' ') + "x", header, re));
    EXPECT_FALSE(search.accept_match(file, "int x; #include \"x.h\"", header, re));
}

TEST_F(IncludeSearchTest, IgnoresNonSourceFiles) {
    tree.file("a/b/notes.txt", "#include <a/b/x.h>\n");
    tree.file("a/b/other.h", "#include <a/b/x.h>\n");

    auto result = find();

    EXPECT_FALSE(result.has_value());
}

TEST_F(IncludeSearchTest, NoIncludersYieldsNullopt) {
    tree.file("a/b/unrelated.cpp", "#include <vector>\nint main() {}\n");

    EXPECT_FALSE(find().has_value());
}

TEST_F(IncludeSearchTest, HeaderAtProjectRoot) {
    auto root_header = tree.file("top.h");
    auto source = tree.file("src/top_user.cpp", "#include \"top.h\"\n");

    CancellationToken token;
    auto result = make_search().find_including_source_file(root_header, tree.root(), token);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, AcceptsNonNormalizedInputs) {
    auto source = tree.file("a/b/impl/y.cpp", "#include <a/b/x.h>\n");

    CancellationToken token;
    auto result = make_search().find_including_source_file(
        tree.root() / "a" / "." / "b" / ".." / "b" / "x.h", tree.root() / "", token);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, InvalidInputThrows) {
    CancellationToken token;
    auto search = make_search();

    EXPECT_THROW(search.find_including_source_file("", tree.root(), token), std::invalid_argument);
    EXPECT_THROW(search.find_including_source_file(tree.root() / "a/", tree.root(), token),
                 std::invalid_argument);
    EXPECT_THROW(search.find_including_source_file(header, "", token), std::invalid_argument);
    EXPECT_THROW(search.start("", tree.root()), std::invalid_argument);
}

TEST_F(IncludeSearchTest, CancelledTokenYieldsNullopt) {
    tree.file("a/b/impl/y.cpp", "#include <a/b/x.h>\n");

    CancellationToken token;
    token.cancel();
    auto result = make_search().find_including_source_file(header, tree.root(), token);

    EXPECT_FALSE(result.has_value());
}

TEST_F(IncludeSearchTest, ScannerFailurePropagatesAsScanError) {
    IncludeSearch search(PathClassifier(), std::make_shared<FailingScanner>());

    CancellationToken token;
    EXPECT_THROW(search.find_including_source_file(header, tree.root(), token), ScanError);

    auto handle = search.start(header, tree.root());
    EXPECT_THROW(handle.get(), ScanError);
}

TEST_F(IncludeSearchTest, MissingHeaderDirectoryIsScanError) {
    IncludeSearch search = make_search();

    CancellationToken token;
    EXPECT_THROW(search.find_including_source_file(tree.root() / "gone/x.h", tree.root(), token),
                 ScanError);
}

TEST_F(IncludeSearchTest, BackgroundSearchFindsInclude) {
    auto source = tree.file("a/b/impl/y.cpp", "#include <a/b/x.h>\n");

    auto handle = make_search().start(header, tree.root());

    ASSERT_TRUE(handle.wait_for(10s));
    auto result = handle.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, BackgroundSearchReportsNoMatchOnce) {
    auto handle = make_search().start(header, tree.root());

    ASSERT_TRUE(handle.wait_for(10s));
    EXPECT_FALSE(handle.get().has_value());
}

TEST_F(IncludeSearchTest, CancelImmediatelyThenSearchAgain) {
    auto source = tree.file("a/b/impl/y.cpp", "#include <a/b/x.h>\n");
    auto search = make_search();

    {
        auto handle = search.start(header, tree.root());
        handle.cancel();
        ASSERT_TRUE(handle.wait_for(10s));
        // Either cancelled before or after the match; both are valid outcomes
        auto result = handle.get();
        if (result) {
            EXPECT_EQ(*result, source);
        }
    }

    auto handle = search.start(header, tree.root());
    ASSERT_TRUE(handle.wait_for(10s));
    auto result = handle.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, source);
}

TEST_F(IncludeSearchTest, DestroyingHandleStopsBackgroundScan) {
    auto scanner = std::make_shared<BlockingScanner>();
    IncludeSearch search(PathClassifier(), scanner);

    {
        auto handle = search.start(header, tree.root());
        EXPECT_FALSE(handle.wait_for(50ms));
    }

    EXPECT_EQ(scanner->finished(), 1);
    EXPECT_FALSE(scanner->running());
}

TEST(SearchScopeTest, Names) {
    EXPECT_EQ(to_string(SearchScope::HEADER_DIRECTORY), "header_directory");
    EXPECT_EQ(to_string(SearchScope::PROJECT_ROOT), "project_root");
    EXPECT_EQ(scope_from_string("project_root"), SearchScope::PROJECT_ROOT);
    EXPECT_THROW(scope_from_string("everywhere"), std::invalid_argument);
}
