#include "cia/types.hpp"

#include <gtest/gtest.h>
#include <map>

namespace cia
{
    TEST(TypesTest, SymbolKindRoundTrip) {
        for (const auto kind : {SymbolKind::Function, SymbolKind::Method, SymbolKind::Class,
                                SymbolKind::Interface, SymbolKind::Struct, SymbolKind::Variable,
                                SymbolKind::Constant, SymbolKind::Type, SymbolKind::Import}) {
            const auto parsed = symbol_kind_from_string(to_string(kind));
            ASSERT_TRUE(parsed.has_value()) << to_string(kind);
            EXPECT_EQ(*parsed, kind);
        }
    }

    TEST(TypesTest, SymbolKindFromUnknownString) {
        EXPECT_FALSE(symbol_kind_from_string("enum").has_value());
        EXPECT_FALSE(symbol_kind_from_string("").has_value());
        EXPECT_FALSE(symbol_kind_from_string("Function").has_value());
    }

    TEST(TypesTest, LanguageNames) {
        EXPECT_STREQ(to_string(Language::Go), "go");
        EXPECT_STREQ(to_string(Language::TypeScript), "typescript");
        EXPECT_STREQ(to_string(Language::Unknown), "unknown");
    }

    TEST(TypesTest, SymbolCallableAndLineRange) {
        Symbol fn;
        fn.name = "GetUser";
        fn.kind = SymbolKind::Function;
        fn.start_line = 3;
        fn.end_line = 8;

        EXPECT_TRUE(fn.is_callable());
        EXPECT_TRUE(fn.contains_line(3));
        EXPECT_TRUE(fn.contains_line(8));
        EXPECT_FALSE(fn.contains_line(9));
        EXPECT_FALSE(fn.contains_line(2));

        Symbol user;
        user.name = "User";
        user.kind = SymbolKind::Struct;
        EXPECT_FALSE(user.is_callable());
    }

    TEST(TypesTest, SymbolKeyIdentity) {
        Symbol method;
        method.name = "Name";
        method.kind = SymbolKind::Method;
        method.parent = "User";
        method.start_line = 10;

        Symbol moved = method;
        moved.start_line = 42;
        moved.signature = "func (u *User) Name() string";

        EXPECT_EQ(SymbolKey::of(method), SymbolKey::of(moved));
        EXPECT_EQ(SymbolKey::of(method).to_string(), "Name:method:User");

        Symbol other_parent = method;
        other_parent.parent = "Admin";
        EXPECT_NE(SymbolKey::of(method), SymbolKey::of(other_parent));
    }

    TEST(TypesTest, SymbolKeyOrderingIsUsableInMaps) {
        std::map<SymbolKey, int> keys;
        keys[{"B", SymbolKind::Function, ""}] = 1;
        keys[{"A", SymbolKind::Method, "T"}] = 2;
        keys[{"A", SymbolKind::Function, ""}] = 3;

        ASSERT_EQ(keys.size(), 3u);
        EXPECT_EQ(keys.begin()->first.name, "A");
        EXPECT_EQ(keys.begin()->first.kind, SymbolKind::Function);
    }

}  // namespace cia
