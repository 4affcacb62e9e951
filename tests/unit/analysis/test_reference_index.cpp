#include "cia/analysis/reference_index.hpp"
#include "cia/extractors/extractor.hpp"

#include <gtest/gtest.h>

namespace cia::analysis
{
    namespace {

        const char* kUserGo = R"(package user

type User struct {
	Name string
}

func GetUser(id int) *User {
	return &User{}
}
)";

        const char* kHandlerGo = R"(package api

// GetUser is called below
func Handle(id int) {
	u := GetUser(id)
	_ = u
	GetUser(id + 1)
}
)";

        std::vector<Symbol> symbols_of(const std::string& path, const std::string& content) {
            auto result = extractors::extract_symbols(path, content);
            EXPECT_TRUE(result.is_ok());
            return result.is_ok() ? std::move(result).value() : std::vector<Symbol>{};
        }

    }  // namespace

    class ReferenceIndexTest : public ::testing::Test {
    protected:
        void add(const std::string& path, const std::string& content,
                 const ReindexPolicy policy = ReindexPolicy::Append) {
            index_.add_file(path, content, symbols_of(path, content), policy);
        }

        ReferenceIndex index_;
    };

    TEST_F(ReferenceIndexTest, ReferencesAcrossFiles) {
        add("user.go", kUserGo);
        add("handler.go", kHandlerGo);

        const auto refs = index_.symbol_references("GetUser");
        ASSERT_EQ(refs.size(), 2u);
        EXPECT_EQ(refs[0].file_path, "handler.go");
        EXPECT_EQ(refs[0].line, 5u);
        EXPECT_EQ(refs[0].context, "u := GetUser(id)");
        EXPECT_EQ(refs[1].line, 7u);
        EXPECT_EQ(refs[1].context, "GetUser(id + 1)");
    }

    TEST_F(ReferenceIndexTest, DefinitionLinesAreNotReferences) {
        add("user.go", kUserGo);

        const auto refs = index_.symbol_references("User");
        ASSERT_EQ(refs.size(), 2u);
        EXPECT_EQ(refs[0].line, 7u);
        EXPECT_EQ(refs[1].line, 8u);
        EXPECT_TRUE(index_.symbol_references("GetUser").empty());
    }

    TEST_F(ReferenceIndexTest, CommentLinesAreSkipped) {
        add("user.go", kUserGo);
        add("handler.go", kHandlerGo);

        for (const auto& ref : index_.symbol_references("GetUser")) {
            EXPECT_NE(ref.line, 3u);
        }
    }

    TEST_F(ReferenceIndexTest, CustomCommentPrefixes) {
        ReferenceIndex index({"--"});
        Symbol symbol;
        symbol.name = "Total";
        symbol.file_path = "a.sql";
        symbol.start_line = 1;
        symbol.end_line = 1;

        index.add_file("a.sql", "Total\n// Total\n-- Total\n", {symbol}, ReindexPolicy::Append);

        const auto refs = index.symbol_references("Total");
        ASSERT_EQ(refs.size(), 1u);
        EXPECT_EQ(refs[0].line, 2u);
    }

    TEST_F(ReferenceIndexTest, WholeWordsOnly) {
        Symbol symbol;
        symbol.name = "GetUser";
        symbol.file_path = "lib.go";
        symbol.start_line = 1;
        index_.add_file("lib.go", "GetUser\n", {symbol}, ReindexPolicy::Append);
        index_.add_file("use.go",
                        "GetUserName(x)\n"
                        "myGetUser()\n"
                        "GetUser\xC3\xA9()\n"
                        "x.GetUser()\n"
                        "GetUser(GetUser(1))\n",
                        {}, ReindexPolicy::Append);

        const auto refs = index_.symbol_references("GetUser");
        ASSERT_EQ(refs.size(), 2u);
        EXPECT_EQ(refs[0].line, 4u);
        EXPECT_EQ(refs[1].line, 5u);
    }

    TEST_F(ReferenceIndexTest, DependentsAndDependencies) {
        add("user.go", kUserGo);
        add("handler.go", kHandlerGo);

        EXPECT_EQ(index_.dependents("user.go"), (std::vector<std::string>{"handler.go"}));
        EXPECT_TRUE(index_.dependents("handler.go").empty());
        EXPECT_EQ(index_.dependencies("handler.go"), (std::vector<std::string>{"user.go"}));
        EXPECT_TRUE(index_.dependencies("user.go").empty());
        EXPECT_TRUE(index_.dependents("missing.go").empty());
    }

    TEST_F(ReferenceIndexTest, IndexOrderMattersUntilRebuild) {
        add("handler.go", kHandlerGo);
        add("user.go", kUserGo);

        EXPECT_TRUE(index_.symbol_references("GetUser").empty());

        index_.rebuild_references();

        const auto refs = index_.symbol_references("GetUser");
        ASSERT_EQ(refs.size(), 2u);
        EXPECT_EQ(refs[0].file_path, "handler.go");
        EXPECT_EQ(index_.symbol_references("User").size(), 2u);
    }

    TEST_F(ReferenceIndexTest, AppendKeepsEarlierContributions) {
        add("user.go", kUserGo);
        add("user.go", kUserGo);

        EXPECT_EQ(index_.find_symbol("GetUser").size(), 2u);
        EXPECT_EQ(index_.symbol_references("User").size(), 4u);
        EXPECT_EQ(index_.symbols_in_file("user.go").size(), 2u);
        EXPECT_EQ(index_.indexed_files(), (std::vector<std::string>{"user.go"}));
    }

    TEST_F(ReferenceIndexTest, ReplaceDropsEarlierContributions) {
        add("user.go", kUserGo, ReindexPolicy::Replace);
        add("user.go", kUserGo, ReindexPolicy::Replace);

        EXPECT_EQ(index_.find_symbol("GetUser").size(), 1u);
        EXPECT_EQ(index_.symbol_references("User").size(), 2u);
    }

    TEST_F(ReferenceIndexTest, RemoveFile) {
        add("user.go", kUserGo);
        add("handler.go", kHandlerGo);

        EXPECT_TRUE(index_.remove_file("handler.go"));
        EXPECT_FALSE(index_.remove_file("handler.go"));

        EXPECT_TRUE(index_.symbol_references("GetUser").empty());
        EXPECT_TRUE(index_.find_symbol("Handle").empty());
        EXPECT_EQ(index_.symbol_references("User").size(), 2u);
        EXPECT_EQ(index_.indexed_files(), (std::vector<std::string>{"user.go"}));
    }

    TEST_F(ReferenceIndexTest, Stats) {
        add("user.go", kUserGo);
        add("handler.go", kHandlerGo);

        const auto stats = index_.stats();
        EXPECT_EQ(stats.files, 2u);
        EXPECT_EQ(stats.symbols, 3u);
        EXPECT_EQ(stats.distinct_names, 3u);
        EXPECT_EQ(stats.references, 4u);

        index_.clear();
        const auto empty = index_.stats();
        EXPECT_EQ(empty.files, 0u);
        EXPECT_EQ(empty.references, 0u);
        EXPECT_TRUE(index_.indexed_files().empty());
    }

    TEST_F(ReferenceIndexTest, FindSymbolAcrossFiles) {
        add("user.go", kUserGo);
        add("admin.go", "package admin\n\nfunc GetUser() {}\n");

        const auto defs = index_.find_symbol("GetUser");
        ASSERT_EQ(defs.size(), 2u);
        EXPECT_EQ(defs[0].file_path, "user.go");
        EXPECT_EQ(defs[1].file_path, "admin.go");
        EXPECT_TRUE(index_.find_symbol("Missing").empty());
    }

    TEST_F(ReferenceIndexTest, TypeUsedFromAnotherFile) {
        add("user.go", kUserGo);
        add("handler.go", "package api\n\nfunc Create() *User {\n\treturn NewUser(\"x\")\n}\n");

        const auto refs = index_.symbol_references("User");
        ASSERT_EQ(refs.size(), 3u);
        EXPECT_EQ(refs[2].file_path, "handler.go");
        EXPECT_EQ(refs[2].line, 3u);
        EXPECT_EQ(refs[2].context, "func Create() *User {");
    }

}  // namespace cia::analysis
