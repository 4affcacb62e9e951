#include "cia/extractors/typescript_extractor.hpp"

#include <gtest/gtest.h>

namespace cia::extractors
{
    namespace {

        const char* kServiceSource = R"(import { Db } from "./db";

export interface User {
  id: number;
  name: string;
}

export type UserId = number;

export async function getUser(id: UserId, db: Db): Promise<User> {
  return db.find(id);
}

function helper(x) {
  return x;
}

export const formatUser = (user: User): string => user.name;

export const MAX_USERS = 100;

export class UserService {
  private cache: Map<number, User>;

  constructor(private db: Db) {}

  async findAll(limit: number): Promise<User[]> {
    if (limit > 0) {
      return this.db.all(limit);
    }
    return [];
  }

  private reset(): void {
    this.cache.clear();
  }
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

    class TypeScriptExtractorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            auto result = extractor_.extract(kServiceSource, "service.ts");
            ASSERT_TRUE(result.is_ok());
            symbols_ = std::move(result).value();
        }

        TypeScriptSymbolExtractor extractor_;
        std::vector<Symbol> symbols_;
    };

    TEST_F(TypeScriptExtractorTest, Metadata) {
        EXPECT_EQ(extractor_.name(), "TypeScript");
        EXPECT_EQ(extractor_.language(), Language::TypeScript);
        EXPECT_EQ(extractor_.supported_extensions(), (std::vector<std::string>{".ts", ".tsx"}));
        EXPECT_FALSE(extractor_.validates_syntax());
    }

    TEST_F(TypeScriptExtractorTest, SymbolsAreOrderedByLine) {
        std::vector<std::string> names;
        for (const auto& symbol : symbols_) {
            names.push_back(symbol.name);
        }
        const std::vector<std::string> expected = {
            "User", "UserId", "getUser", "helper", "formatUser", "MAX_USERS",
            "UserService", "constructor", "findAll", "reset"
        };
        EXPECT_EQ(names, expected);
    }

    TEST_F(TypeScriptExtractorTest, InterfaceAndTypeAlias) {
        const auto* user = find(symbols_, "User");
        ASSERT_NE(user, nullptr);
        EXPECT_EQ(user->kind, SymbolKind::Interface);
        EXPECT_EQ(user->start_line, 3u);
        EXPECT_EQ(user->end_line, 6u);
        EXPECT_TRUE(user->exported);

        const auto* alias = find(symbols_, "UserId");
        ASSERT_NE(alias, nullptr);
        EXPECT_EQ(alias->kind, SymbolKind::Type);
        EXPECT_EQ(alias->end_line, 8u);
    }

    TEST_F(TypeScriptExtractorTest, ExportedAsyncFunction) {
        const auto* fn = find(symbols_, "getUser");

        ASSERT_NE(fn, nullptr);
        EXPECT_EQ(fn->kind, SymbolKind::Function);
        EXPECT_TRUE(fn->exported);
        EXPECT_EQ(fn->parameters, (std::vector<std::string>{"id: UserId", "db: Db"}));
        EXPECT_EQ(fn->return_type, "Promise<User>");
        EXPECT_EQ(fn->signature, "export async function getUser(id: UserId, db: Db): Promise<User>");
        EXPECT_EQ(fn->start_line, 10u);
        EXPECT_EQ(fn->end_line, 12u);
    }

    TEST_F(TypeScriptExtractorTest, UnexportedFunction) {
        const auto* fn = find(symbols_, "helper");

        ASSERT_NE(fn, nullptr);
        EXPECT_FALSE(fn->exported);
        EXPECT_EQ(fn->parameters, (std::vector<std::string>{"x"}));
        EXPECT_TRUE(fn->return_type.empty());
    }

    TEST_F(TypeScriptExtractorTest, ArrowFunctionIsReportedOnce) {
        int count = 0;
        for (const auto& symbol : symbols_) {
            if (symbol.name == "formatUser") {
                ++count;
                EXPECT_EQ(symbol.kind, SymbolKind::Function);
                EXPECT_EQ(symbol.parameters, (std::vector<std::string>{"user: User"}));
                EXPECT_EQ(symbol.return_type, "string");
            }
        }
        EXPECT_EQ(count, 1);

        const auto* constant = find(symbols_, "MAX_USERS");
        ASSERT_NE(constant, nullptr);
        EXPECT_EQ(constant->kind, SymbolKind::Constant);
        EXPECT_TRUE(constant->exported);
    }

    TEST_F(TypeScriptExtractorTest, ClassAndMethods) {
        const auto* cls = find(symbols_, "UserService");
        ASSERT_NE(cls, nullptr);
        EXPECT_EQ(cls->kind, SymbolKind::Class);
        EXPECT_EQ(cls->start_line, 22u);
        EXPECT_EQ(cls->end_line, 37u);

        const auto* find_all = find(symbols_, "findAll");
        ASSERT_NE(find_all, nullptr);
        EXPECT_EQ(find_all->kind, SymbolKind::Method);
        EXPECT_EQ(find_all->parent, "UserService");
        EXPECT_TRUE(find_all->exported);
        EXPECT_EQ(find_all->parameters, (std::vector<std::string>{"limit: number"}));
        EXPECT_EQ(find_all->return_type, "Promise<User[]>");
        EXPECT_EQ(find_all->end_line, 32u);

        const auto* reset = find(symbols_, "reset");
        ASSERT_NE(reset, nullptr);
        EXPECT_FALSE(reset->exported);
        EXPECT_EQ(reset->return_type, "void");
    }

    TEST_F(TypeScriptExtractorTest, StatementsInsideMethodBodiesAreNotMethods) {
        EXPECT_EQ(find(symbols_, "if"), nullptr);
        EXPECT_EQ(find(symbols_, "all"), nullptr);
        EXPECT_EQ(find(symbols_, "cache"), nullptr);
    }

    TEST(JavaScriptExtractorTest, JavaScriptFlavour) {
        const TypeScriptSymbolExtractor extractor(Language::JavaScript);

        EXPECT_EQ(extractor.name(), "JavaScript");
        EXPECT_EQ(extractor.supported_extensions(), (std::vector<std::string>{".js", ".jsx", ".mjs"}));

        auto result = extractor.extract(
            "export default function main(argv) {\n"
            "  return run(argv);\n"
            "}\n"
            "const handler = async (req, res) => {\n"
            "  res.end();\n"
            "};\n",
            "main.js");
        ASSERT_TRUE(result.is_ok());

        const auto& symbols = result.value();
        ASSERT_EQ(symbols.size(), 2u);
        EXPECT_EQ(symbols[0].name, "main");
        EXPECT_TRUE(symbols[0].exported);
        EXPECT_EQ(symbols[0].end_line, 3u);
        EXPECT_EQ(symbols[1].name, "handler");
        EXPECT_EQ(symbols[1].kind, SymbolKind::Function);
        EXPECT_FALSE(symbols[1].exported);
        EXPECT_EQ(symbols[1].parameters, (std::vector<std::string>{"req", "res"}));
        EXPECT_EQ(symbols[1].end_line, 6u);
    }

    TEST(JavaScriptExtractorTest, EmptyInput) {
        const TypeScriptSymbolExtractor extractor;
        auto result = extractor.extract("", "empty.ts");

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

}  // namespace cia::extractors
