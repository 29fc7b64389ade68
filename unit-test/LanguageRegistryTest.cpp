#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/language.hpp"

using namespace std;
using namespace nlohmann;
using namespace boxjudge;

TEST(LanguageRegistryTest, BuiltinProfilesTest) {
    auto registry = language_registry::builtin();

    auto &python = registry.resolve("python");
    EXPECT_FALSE(python.needs_compilation());
    EXPECT_EQ(python.source_file(), "main.py");
    EXPECT_EQ(python.run_command_line(), "python3 main.py");
    EXPECT_THROW(python.compile_command_line(), logic_error);

    auto &cpp = registry.resolve("cpp");
    EXPECT_TRUE(cpp.needs_compilation());
    EXPECT_EQ(cpp.compile_command_line(), "g++ -O2 -std=c++17 -o main main.cpp");
    EXPECT_EQ(cpp.run_command_line(), "./main");

    EXPECT_EQ(registry.languages(), (vector<string>{"cpp", "python"}));
}

TEST(LanguageRegistryTest, UnsupportedLanguageTest) {
    auto registry = language_registry::builtin();
    try {
        registry.resolve("brainfuck");
        FAIL() << "brainfuck should not be supported";
    } catch (unsupported_language &e) {
        EXPECT_EQ(e.language, "brainfuck");
        EXPECT_STREQ(e.what(), "Unsupported language: brainfuck");
    }
}

TEST(LanguageRegistryTest, FromJsonTest) {
    json config = R"({
        "languages": {
            "go": {"image": "golang:1.21", "extension": ".go", "compile": "go build -o {basename} {filename}", "run": "./{basename}"},
            "ruby": {"image": "ruby:3", "extension": ".rb", "run": "ruby {filename}"}
        }
    })"_json;
    auto registry = language_registry::from_json(config);

    auto &go = registry.resolve("go");
    EXPECT_EQ(go.id, "go");
    EXPECT_EQ(go.image, "golang:1.21");
    EXPECT_EQ(go.compile_command_line(), "go build -o main main.go");

    auto &ruby = registry.resolve("ruby");
    EXPECT_FALSE(ruby.needs_compilation());
    EXPECT_EQ(ruby.run_command_line(), "ruby main.rb");
    EXPECT_THROW(registry.resolve("python"), unsupported_language);
}

TEST(LanguageRegistryTest, MalformedTemplateTest) {
    json config = R"({"languages": {"sh": {"image": "alpine", "extension": ".sh", "run": "sh {source}"}}})"_json;
    EXPECT_THROW(language_registry::from_json(config), invalid_argument);
}

TEST(LanguageRegistryTest, EscapedBracesTest) {
    json config = R"({"languages": {"awk": {"image": "alpine", "extension": ".awk", "run": "awk -f {filename} | awk '{{print $1}}'"}}})"_json;
    auto registry = language_registry::from_json(config);
    EXPECT_EQ(registry.resolve("awk").run_command_line(), "awk -f main.awk | awk '{print $1}'");
}

TEST(LanguageRegistryTest, MissingFieldTest) {
    json config = R"({"languages": {"sh": {"extension": ".sh", "run": "sh {filename}"}}})"_json;
    EXPECT_THROW(language_registry::from_json(config), invalid_argument);
    EXPECT_THROW(language_registry::from_json(R"({"lang": {}})"_json), invalid_argument);
}

TEST(LanguageRegistryTest, MalformedExtensionTest) {
    language_profile profile;
    profile.id = "evil";
    profile.image = "alpine";
    profile.extension = "/../../etc/passwd";
    profile.run_command = "cat {filename}";
    EXPECT_THROW(language_registry({profile}), invalid_argument);

    profile.extension = "sh";
    EXPECT_THROW(language_registry({profile}), invalid_argument);
}

TEST(LanguageRegistryTest, DuplicatedLanguageTest) {
    language_profile profile;
    profile.id = "sh";
    profile.image = "alpine";
    profile.extension = ".sh";
    profile.run_command = "sh {filename}";
    EXPECT_THROW(language_registry({profile, profile}), invalid_argument);
}
