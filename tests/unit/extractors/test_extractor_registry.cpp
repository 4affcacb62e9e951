#include "cia/extractors/all_extractors.hpp"

#include <gtest/gtest.h>

namespace cia::extractors
{
    namespace {

        class FixedPythonExtractor : public ISymbolExtractor {
        public:
            [[nodiscard]] std::string_view name() const noexcept override {
                return "FixedPython";
            }

            [[nodiscard]] Language language() const noexcept override {
                return Language::Python;
            }

            [[nodiscard]] std::vector<std::string> supported_extensions() const override {
                return {".py"};
            }

            [[nodiscard]] Result<std::vector<Symbol>, Error> extract(
                std::string_view,
                const std::string& file_path
            ) const override {
                Symbol symbol;
                symbol.name = "fixed";
                symbol.file_path = file_path;
                return Result<std::vector<Symbol>, Error>::success({symbol});
            }
        };

    }  // namespace

    TEST(ExtractorRegistryTest, BuiltinsAreRegistered) {
        const auto extractors = ExtractorRegistry::instance().list_extractors();

        ASSERT_EQ(extractors.size(), 6u);
        EXPECT_NE(ExtractorRegistry::instance().get_extractor(Language::Go), nullptr);
        EXPECT_NE(ExtractorRegistry::instance().get_extractor(Language::JavaScript), nullptr);
        EXPECT_EQ(ExtractorRegistry::instance().get_extractor(Language::Unknown), nullptr);
    }

    TEST(ExtractorRegistryTest, FindByExtension) {
        auto& registry = ExtractorRegistry::instance();

        ASSERT_NE(registry.find_extractor_for_file("pkg/user.go"), nullptr);
        EXPECT_EQ(registry.find_extractor_for_file("pkg/user.go")->name(), "Go");
        EXPECT_EQ(registry.find_extractor_for_file("web/App.TSX")->name(), "TypeScript");
        EXPECT_EQ(registry.find_extractor_for_file("web/index.mjs")->name(), "JavaScript");
        EXPECT_EQ(registry.find_extractor_for_file("lib.rs")->name(), "Rust");
        EXPECT_EQ(registry.find_extractor_for_file("Main.java")->name(), "Java");
        EXPECT_EQ(registry.find_extractor_for_file("notes.txt"), nullptr);
        EXPECT_EQ(registry.find_extractor_for_file("Makefile"), nullptr);
    }

    TEST(ExtractorRegistryTest, RegisteringReplacesSameLanguage) {
        auto& registry = ExtractorRegistry::instance();
        registry.register_extractor(std::make_unique<FixedPythonExtractor>());

        EXPECT_EQ(registry.list_extractors().size(), 6u);
        EXPECT_EQ(registry.get_extractor(Language::Python)->name(), "FixedPython");

        auto symbols = extract_symbols("app.py", "def real(): pass\n");
        ASSERT_TRUE(symbols.is_ok());
        ASSERT_EQ(symbols.value().size(), 1u);
        EXPECT_EQ(symbols.value()[0].name, "fixed");

        register_python_extractor(registry);
        EXPECT_EQ(registry.get_extractor(Language::Python)->name(), "Python");
    }

    TEST(ExtractorRegistryTest, NullExtractorIsIgnored) {
        auto& registry = ExtractorRegistry::instance();
        registry.register_extractor(nullptr);

        EXPECT_EQ(registry.list_extractors().size(), 6u);
    }

    TEST(ExtractorRegistryTest, DetectLanguage) {
        EXPECT_EQ(detect_language("a.go"), Language::Go);
        EXPECT_EQ(detect_language("a.ts"), Language::TypeScript);
        EXPECT_EQ(detect_language("a.jsx"), Language::JavaScript);
        EXPECT_EQ(detect_language("a.PY"), Language::Python);
        EXPECT_EQ(detect_language("a.rs"), Language::Rust);
        EXPECT_EQ(detect_language("A.java"), Language::Java);
        EXPECT_EQ(detect_language("a.cpp"), Language::Unknown);

        EXPECT_EQ(language_name("main.go"), "go");
        EXPECT_EQ(language_name("README"), "");
    }

    TEST(ExtractorRegistryTest, UnsupportedFilesYieldNoSymbols) {
        auto symbols = extract_symbols("README.md", "# Title\nfunc Main() {}\n");

        ASSERT_TRUE(symbols.is_ok());
        EXPECT_TRUE(symbols.value().empty());
    }

    TEST(ExtractorRegistryTest, InvalidGoIsAnError) {
        auto symbols = extract_symbols("broken.go", "package main\nfunc {\n");

        ASSERT_TRUE(symbols.is_err());
        EXPECT_EQ(symbols.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(symbols.error().context().value().rfind("broken.go:", 0), 0u);
    }

    TEST(ExtractorRegistryTest, InvalidHeuristicSourceStillSucceeds) {
        auto symbols = extract_symbols("broken.ts", "export function (((\n");

        EXPECT_TRUE(symbols.is_ok());
    }

}  // namespace cia::extractors
