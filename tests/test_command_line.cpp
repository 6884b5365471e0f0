#include <gtest/gtest.h>
#include <cli/command_line.hpp>
#include <core/config.hpp>
#include <templates/search_roots.hpp>

using Args = std::vector<std::string>;

TEST(CommandLine, NotebookPositional) {
    auto r = parse_command_line({"example.ipynb"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.notebook_path.value_or(""), "example.ipynb");
}

TEST(CommandLine, NoArgsIsTreeMode) {
    auto r = parse_command_line({});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.notebook_path.has_value());
    EXPECT_TRUE(r.value.overrides.empty());
}

TEST(CommandLine, EqualsAndSpaceForms) {
    auto r = parse_command_line({"--port=8888", "--template", "gridstack", "nb.ipynb"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.overrides.at("port"), "8888");
    EXPECT_EQ(r.value.overrides.at("template"), "gridstack");
    EXPECT_EQ(r.value.notebook_path.value_or(""), "nb.ipynb");
}

TEST(CommandLine, StaticAliasMapsToStaticRoot) {
    auto r = parse_command_line({"--static=/srv/static"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.overrides.at("static_root"), "/srv/static");
}

TEST(CommandLine, BareBooleanFlagDoesNotEatNotebook) {
    auto r = parse_command_line({"--autoreload", "nb.ipynb"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.overrides.at("autoreload"), "true");
    EXPECT_EQ(r.value.notebook_path.value_or(""), "nb.ipynb");
}

TEST(CommandLine, BooleanWithSeparateValue) {
    auto r = parse_command_line({"--strip_sources", "False"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.overrides.at("strip_sources"), "False");
}

TEST(CommandLine, EmptyTemplateAllowed) {
    auto r = parse_command_line({"--template="});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.overrides.at("template"), "");
}

TEST(CommandLine, HelpVersionDebug) {
    auto r = parse_command_line({"--help", "--version", "--debug"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.show_help);
    EXPECT_TRUE(r.value.show_version);
    EXPECT_EQ(r.value.overrides.at("log_level"), "DEBUG");
}

TEST(CommandLine, Errors) {
    EXPECT_TRUE(parse_command_line({"--colour=red"}).is_err());
    EXPECT_TRUE(parse_command_line({"--port"}).is_err());
    EXPECT_TRUE(parse_command_line({"a.ipynb", "b.ipynb"}).is_err());
}

TEST(CommandLine, RepeatedTemplateDirs) {
    auto r = parse_command_line({"--template-dir=/a", "--template-dir", "/b"});
    ASSERT_TRUE(r.is_ok()) << r.error;

    ServerOptions options;
    ASSERT_TRUE(apply_command_line(r.value, options).is_ok());
    ASSERT_EQ(options.extra_template_dirs.size(), 2u);
    EXPECT_EQ(options.extra_template_dirs[0], std::filesystem::path("/a"));
    EXPECT_EQ(options.extra_template_dirs[1], std::filesystem::path("/b"));
}

// ── apply_command_line ──────────────────────────────────────

TEST(ApplyCommandLine, OverridesConfigValues) {
    ServerOptions options;
    options.port = 9000;
    options.template_name = "lab";

    auto cmd = parse_command_line({"--port=8888", "--strip_sources=no", "--log-level=warning", "nb.ipynb"});
    ASSERT_TRUE(cmd.is_ok()) << cmd.error;
    ASSERT_TRUE(apply_command_line(cmd.value, options).is_ok());

    EXPECT_EQ(options.port, 8888);
    EXPECT_FALSE(options.strip_sources);
    EXPECT_EQ(options.log_level, LogLevel::Warning);
    EXPECT_EQ(options.template_name, "lab");
    EXPECT_EQ(options.notebook_path.value_or(""), "nb.ipynb");
}

TEST(ApplyCommandLine, TemplateDirsReplaceConfigList) {
    Config config;
    ASSERT_TRUE(config.apply_yaml("extra_template_dirs: [/from/config]\n", "project").is_ok());
    ServerOptions options = config.options();

    auto cmd = parse_command_line({"--template-dir=/from/cli"});
    ASSERT_TRUE(cmd.is_ok()) << cmd.error;
    ASSERT_TRUE(apply_command_line(cmd.value, options).is_ok());

    ASSERT_EQ(options.extra_template_dirs.size(), 1u);
    EXPECT_EQ(options.extra_template_dirs[0], std::filesystem::path("/from/cli"));

    auto roots = template_search_roots(options.extra_template_dirs);
    ASSERT_FALSE(roots.empty());
    EXPECT_EQ(roots[0], std::filesystem::path("/from/cli"));
}

TEST(ApplyCommandLine, ConfigTemplateDirsKeptWithoutOption) {
    Config config;
    ASSERT_TRUE(config.apply_yaml("extra_template_dirs: [/from/config]\n", "project").is_ok());
    ServerOptions options = config.options();

    auto cmd = parse_command_line({"--port=9999"});
    ASSERT_TRUE(cmd.is_ok()) << cmd.error;
    ASSERT_TRUE(apply_command_line(cmd.value, options).is_ok());

    ASSERT_EQ(options.extra_template_dirs.size(), 1u);
    EXPECT_EQ(options.extra_template_dirs[0], std::filesystem::path("/from/config"));
}

TEST(ApplyCommandLine, InvalidValues) {
    ServerOptions options;
    for (const Args& args : {Args{"--port=abc"}, Args{"--port=0"}, Args{"--autoreload=perhaps"},
                             Args{"--log-level=loud"}}) {
        auto cmd = parse_command_line(args);
        ASSERT_TRUE(cmd.is_ok()) << cmd.error;
        EXPECT_TRUE(apply_command_line(cmd.value, options).is_err()) << args[0];
    }
}

TEST(CommandLine, UsageMentionsOptions) {
    std::string usage = usage_text();
    EXPECT_NE(usage.find("--template"), std::string::npos);
    EXPECT_NE(usage.find("8866"), std::string::npos);
}
