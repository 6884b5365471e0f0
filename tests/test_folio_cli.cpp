#include <gtest/gtest.h>
#include <cli/folio_cli.hpp>
#include "scratch_dir.hpp"
#include <cstdlib>
#include <optional>
#include <sstream>
#include <fmt/format.h>

// Runs with HOME and the working directory inside the scratch dir, so the
// developer's own ~/.folio/config.yaml and ./folio.yaml are never read.
class FolioCLITest : public ScratchDirTest {
protected:
    std::ostringstream out;
    std::optional<std::string> saved_home;
    fs::path saved_cwd;

    void SetUp() override {
        ScratchDirTest::SetUp();
        saved_home = platform::env("HOME");
        saved_cwd = fs::current_path();
        fs::path home = make_dir("home");
        setenv("HOME", home.c_str(), 1);
        fs::current_path(make_dir("work"));
    }

    void TearDown() override {
        fs::current_path(saved_cwd);
        if (saved_home) {
            setenv("HOME", saved_home->c_str(), 1);
        } else {
            unsetenv("HOME");
        }
        ScratchDirTest::TearDown();
    }

    int run(const std::vector<std::string>& args) {
        FolioCLI cli(out);
        return cli.run(args);
    }
};

TEST_F(FolioCLITest, Help) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.str().find("NOTEBOOK_FILENAME"), std::string::npos);
}

TEST_F(FolioCLITest, UnknownOptionFails) {
    EXPECT_EQ(run({"--bogus=1"}), 1);
    EXPECT_NE(out.str().find("Unknown option"), std::string::npos);
}

TEST_F(FolioCLITest, ResolvesAndPrintsPlan) {
    fs::path roots = make_dir("roots");
    make_template(roots, "default");
    make_template(roots, "custom", R"({"base_template": "default"})");
    fs::path builtin = make_dir("builtin");
    fs::path conn_root = make_dir("conn");

    int status = run({"--template-dir=" + roots.string(), "--template=custom",
                      "--static=" + builtin.string(),
                      "--connection_dir_root=" + conn_root.string(), "nb.ipynb"});
    ASSERT_EQ(status, 0) << out.str();

    std::string text = out.str();
    EXPECT_NE(text.find("custom -> default"), std::string::npos) << text;
    EXPECT_NE(text.find("Resolved template 'custom' (2 layers)"), std::string::npos) << text;
    EXPECT_NE(text.find((roots / "custom" / "templates").string()), std::string::npos);
    EXPECT_NE(text.find(builtin.string()), std::string::npos);
    EXPECT_NE(text.find("/folio/static/(.*)"), std::string::npos);

    // The connection directory only lives as long as the run
    EXPECT_TRUE(fs::is_empty(conn_root));
}

TEST_F(FolioCLITest, CycleFails) {
    fs::path roots = make_dir("roots");
    make_template(roots, "a", R"({"base_template": "b"})");
    make_template(roots, "b", R"({"base_template": "a"})");

    EXPECT_EQ(run({"--template-dir=" + roots.string(), "--template=a",
                   "--connection_dir_root=" + test_dir.string()}), 1);
    EXPECT_NE(out.str().find("cycle"), std::string::npos);
}

TEST_F(FolioCLITest, ReadsProjectConfigFromWorkingDirectory) {
    fs::path roots = make_dir("roots");
    make_template(roots, "default");
    make_template(roots, "fromconfig");
    write_file("work/folio.yaml", fmt::format("template: fromconfig\nextra_template_dirs: [{}]\n",
                                              roots.string()));

    EXPECT_EQ(run({"--connection_dir_root=" + test_dir.string()}), 0) << out.str();
    EXPECT_NE(out.str().find("fromconfig -> default"), std::string::npos) << out.str();
}

TEST_F(FolioCLITest, BrokenUserConfigIsReported) {
    write_file("home/.folio/config.yaml", "port: [not, a, port]\n");
    EXPECT_EQ(run({"--connection_dir_root=" + test_dir.string()}), 1);
    EXPECT_NE(out.str().find("Failed to parse"), std::string::npos) << out.str();
}
