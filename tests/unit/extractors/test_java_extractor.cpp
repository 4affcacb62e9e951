#include "cia/extractors/java_extractor.hpp"

#include <gtest/gtest.h>

namespace cia::extractors
{
    namespace {

        const char* kServiceSource = R"(package com.example;

public class UserService {
    private final Repo repo;

    public UserService(Repo repo) {
        this.repo = repo;
    }

    public User getUser(long id) {
        return repo.find(id);
    }

    public static List<User> listUsers(int limit, String filter) {
        return repo.all(limit);
    }

    private void reset() {
        repo.clear();
    }

    protected static class Cache {
        public int size() {
            return 0;
        }
    }
}

interface Repo {
    User find(long id);
}
)";

        const Symbol* find(const std::vector<Symbol>& symbols, const std::string& name) {
            for (const auto& symbol : symbols) {
                if (symbol.name == name) {
                    return &symbol;
                }
            }
            return nullptr;
        }

    }  // namespace

    class JavaExtractorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            auto result = extractor_.extract(kServiceSource, "UserService.java");
            ASSERT_TRUE(result.is_ok());
            symbols_ = std::move(result).value();
        }

        JavaSymbolExtractor extractor_;
        std::vector<Symbol> symbols_;
    };

    TEST_F(JavaExtractorTest, SymbolsAreOrderedByLine) {
        std::vector<std::string> names;
        for (const auto& symbol : symbols_) {
            names.push_back(symbol.name);
        }
        const std::vector<std::string> expected = {
            "UserService", "getUser", "listUsers", "reset", "Cache", "size", "Repo"
        };
        EXPECT_EQ(names, expected);
    }

    TEST_F(JavaExtractorTest, ClassesAndInterfaces) {
        const auto* service = find(symbols_, "UserService");
        ASSERT_NE(service, nullptr);
        EXPECT_EQ(service->kind, SymbolKind::Class);
        EXPECT_TRUE(service->exported);
        EXPECT_EQ(service->start_line, 3u);
        EXPECT_EQ(service->end_line, 27u);

        const auto* cache = find(symbols_, "Cache");
        ASSERT_NE(cache, nullptr);
        EXPECT_FALSE(cache->exported);
        EXPECT_EQ(cache->end_line, 26u);

        const auto* repo = find(symbols_, "Repo");
        ASSERT_NE(repo, nullptr);
        EXPECT_EQ(repo->kind, SymbolKind::Interface);
        EXPECT_FALSE(repo->exported);
    }

    TEST_F(JavaExtractorTest, PublicMethod) {
        const auto* method = find(symbols_, "getUser");

        ASSERT_NE(method, nullptr);
        EXPECT_EQ(method->kind, SymbolKind::Method);
        EXPECT_EQ(method->parent, "UserService");
        EXPECT_TRUE(method->exported);
        EXPECT_EQ(method->return_type, "User");
        EXPECT_EQ(method->parameters, (std::vector<std::string>{"long id"}));
        EXPECT_EQ(method->signature, "public User getUser(long id)");
        EXPECT_EQ(method->start_line, 10u);
        EXPECT_EQ(method->end_line, 12u);
    }

    TEST_F(JavaExtractorTest, GenericReturnTypeAndModifiers) {
        const auto* method = find(symbols_, "listUsers");

        ASSERT_NE(method, nullptr);
        EXPECT_EQ(method->return_type, "List<User>");
        EXPECT_EQ(method->parameters, (std::vector<std::string>{"int limit", "String filter"}));
    }

    TEST_F(JavaExtractorTest, PrivateMethodIsNotExported) {
        const auto* method = find(symbols_, "reset");

        ASSERT_NE(method, nullptr);
        EXPECT_FALSE(method->exported);
        EXPECT_EQ(method->return_type, "void");
    }

    TEST_F(JavaExtractorTest, NestedClassOwnsItsMethods) {
        const auto* method = find(symbols_, "size");

        ASSERT_NE(method, nullptr);
        EXPECT_EQ(method->parent, "Cache");
        EXPECT_TRUE(method->exported);
    }

    TEST_F(JavaExtractorTest, ConstructorsAndFieldsAreSkipped) {
        int services = 0;
        for (const auto& symbol : symbols_) {
            if (symbol.name == "UserService") {
                ++services;
            }
        }
        EXPECT_EQ(services, 1);
        EXPECT_EQ(find(symbols_, "repo"), nullptr);
        EXPECT_EQ(find(symbols_, "find"), nullptr);
    }

}  // namespace cia::extractors
