#include <gtest/gtest.h>

#include "runner/language.hpp"

namespace coderun::runner {
namespace {

TEST(LanguageTest, DetectsEveryTableEntry) {
    EXPECT_EQ(DetectLanguage("a.py"), Language::kPython);
    EXPECT_EQ(DetectLanguage("a.c"), Language::kC);
    EXPECT_EQ(DetectLanguage("a.cpp"), Language::kCpp);
    EXPECT_EQ(DetectLanguage("a.cxx"), Language::kCpp);
    EXPECT_EQ(DetectLanguage("a.cc"), Language::kCpp);
    EXPECT_EQ(DetectLanguage("/some/dir/Main.java"), Language::kJava);
}

TEST(LanguageTest, ExtensionMatchIsCaseInsensitive) {
    EXPECT_EQ(DetectLanguage("PROGRAM.CPP"), Language::kCpp);
    EXPECT_EQ(DetectLanguage("script.Py"), Language::kPython);
    EXPECT_EQ(DetectLanguage("x.C"), Language::kC);
}

TEST(LanguageTest, RejectsUnknownExtensions) {
    EXPECT_FALSE(DetectLanguage("notes.txt").has_value());
    EXPECT_FALSE(DetectLanguage("Makefile").has_value());
    EXPECT_FALSE(DetectLanguage("archive.py.bak").has_value());
    EXPECT_FALSE(DetectLanguage("header.h").has_value());
}

TEST(LanguageTest, TagsAndExtensionList) {
    EXPECT_STREQ(ToString(Language::kPython), "python");
    EXPECT_STREQ(ToString(Language::kC), "c");
    EXPECT_STREQ(ToString(Language::kCpp), "cpp");
    EXPECT_STREQ(ToString(Language::kJava), "java");
    const std::vector<std::string> expected = {".py", ".c", ".cpp", ".cxx", ".cc", ".java"};
    EXPECT_EQ(SupportedExtensions(), expected);
}

TEST(LanguageTest, ToolchainsUseConfiguredTools) {
    config::RunnerConfig config;
    config.c_compiler = "clang";
    config.cpp_compiler = "clang++";
    config.java_compiler = "/opt/jdk/bin/javac";
    config.java_launcher = "/opt/jdk/bin/java";

    const auto c = MakeToolchain(Language::kC, config);
    EXPECT_EQ(CompileCommand(c, "/src/a.c", "/tmp/x.out"),
              (Command{"clang", "/src/a.c", "-o", "/tmp/x.out"}));
    EXPECT_EQ(RunCommand(c, "/src/a.c", "/tmp/x.out"), (Command{"/tmp/x.out"}));
    EXPECT_EQ(ArtifactFor(c), ArtifactKind::kBinary);

    const auto cpp = MakeToolchain(Language::kCpp, config);
    EXPECT_EQ(CompileCommand(cpp, "/src/a.cc", "/tmp/y.out").front(), "clang++");
    EXPECT_EQ(ArtifactFor(cpp), ArtifactKind::kBinary);

    const auto java = MakeToolchain(Language::kJava, config);
    EXPECT_EQ(CompileCommand(java, "/src/Main.java", "/tmp/classes"),
              (Command{"/opt/jdk/bin/javac", "-d", "/tmp/classes", "/src/Main.java"}));
    EXPECT_EQ(RunCommand(java, "/src/Main.java", "/tmp/classes"),
              (Command{"/opt/jdk/bin/java", "-cp", "/tmp/classes", "Main"}));
    EXPECT_EQ(ArtifactFor(java), ArtifactKind::kClassDirectory);
}

TEST(LanguageTest, PythonHasNoCompileStep) {
    config::RunnerConfig config;
    auto toolchain = MakeToolchain(Language::kPython, config);
    ASSERT_TRUE(std::holds_alternative<PythonToolchain>(toolchain));
    EXPECT_EQ(std::get<PythonToolchain>(toolchain).candidates, config.python_candidates);
    std::get<PythonToolchain>(toolchain).interpreter = "python3";

    EXPECT_TRUE(CompileCommand(toolchain, "/src/a.py", {}).empty());
    EXPECT_EQ(RunCommand(toolchain, "/src/a.py", {}), (Command{"python3", "/src/a.py"}));
    EXPECT_EQ(ArtifactFor(toolchain), ArtifactKind::kNone);
}

}  // namespace
}  // namespace coderun::runner
