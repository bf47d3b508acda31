#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "xdgdirs/cli/application.hpp"
#include "xdgdirs/cli/commands/env_command.hpp"
#include "test_helpers.hpp"

namespace xdgdirs::cli {

class XdgdirsCLITest : public xdgdirs::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        home_ = (temp_dir_ / "home").string();
        std::filesystem::create_directories(home_);
    }

    core::MapEnvironment::Variables homeOnly() const {
        return {{"HOME", "/home/t"}};
    }

    // Helper to run CLI command against a fixed environment and capture output
    std::pair<int, std::string> runCommand(const core::MapEnvironment::Variables& vars,
                                           const std::vector<std::string>& args) {
        Application app(std::make_shared<core::MapEnvironment>(vars));

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>("xdgdirs"));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        std::ostringstream cout_output;
        std::streambuf* orig_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_output.rdbuf());

        int result = 0;
        try {
            result = app.run(static_cast<int>(argv.size()), argv.data());
        } catch (const std::exception&) {
            std::cout.rdbuf(orig_cout);
            throw;
        }

        std::cout.rdbuf(orig_cout);
        return {result, cout_output.str()};
    }

    std::string home_;
};

TEST_F(XdgdirsCLITest, ShowPrintsEveryRole) {
    auto [code, output] = runCommand(homeOnly(), {"show", "go-xdg-test"});

    EXPECT_EQ(code, 0);
    EXPECT_EQ(output,
              "config\t/home/t/.config/go-xdg-test\n"
              "cache\t/home/t/.cache/go-xdg-test\n"
              "data\t/home/t/.local/share/go-xdg-test\n"
              "state\t/home/t/.local/state/go-xdg-test\n"
              "runtime\t\n"
              "config-dirs\t/etc/xdg/go-xdg-test\n"
              "data-dirs\t/usr/local/share/go-xdg-test:/usr/share/go-xdg-test\n");
}

TEST_F(XdgdirsCLITest, ShowSelectedRoles) {
    auto [code, output] = runCommand(homeOnly(),
                                     {"show", "go-xdg-test", "--role", "state", "--role", "config-dirs"});

    EXPECT_EQ(code, 0);
    EXPECT_EQ(output,
              "state\t/home/t/.local/state/go-xdg-test\n"
              "config-dirs\t/etc/xdg/go-xdg-test\n");
}

TEST_F(XdgdirsCLITest, ShowJson) {
    auto vars = homeOnly();
    vars["XDG_RUNTIME_DIR"] = "/run/user/1000";

    auto [code, output] = runCommand(vars, {"--json", "show", "go-xdg-test"});

    ASSERT_EQ(code, 0);
    auto json = nlohmann::json::parse(output);
    EXPECT_EQ(json["app"], "go-xdg-test");
    EXPECT_EQ(json["config"], "/home/t/.config/go-xdg-test");
    EXPECT_EQ(json["runtime"], "/run/user/1000/go-xdg-test");
    ASSERT_TRUE(json["data-dirs"].is_array());
    EXPECT_EQ(json["data-dirs"].size(), 2u);
    EXPECT_EQ(json["data-dirs"][0], "/usr/local/share/go-xdg-test");
}

TEST_F(XdgdirsCLITest, ShowUnknownRoleFails) {
    auto [code, output] = runCommand(homeOnly(), {"show", "go-xdg-test", "--role", "bogus"});

    EXPECT_EQ(code, 1);
    EXPECT_NE(output.find("Unknown role: bogus"), std::string::npos);
}

TEST_F(XdgdirsCLITest, MissingAppNameFails) {
    auto [code, output] = runCommand(homeOnly(), {"--json", "show"});

    EXPECT_EQ(code, 1);
    auto json = nlohmann::json::parse(output);
    EXPECT_EQ(json["code"], static_cast<int>(ErrorCode::kInvalidArgument));
}

TEST_F(XdgdirsCLITest, DefaultAppFromConfig) {
    auto config_path = temp_dir_ / "config.toml";
    std::ofstream(config_path) << "default_app = \"fromconfig\"\n";

    auto [code, output] = runCommand(homeOnly(),
                                     {"--config", config_path.string(), "show", "--role", "cache"});

    EXPECT_EQ(code, 0);
    EXPECT_EQ(output, "cache\t/home/t/.cache/fromconfig\n");
}

TEST_F(XdgdirsCLITest, DefaultConfigLocation) {
    auto config_dir = std::filesystem::path(home_) / ".config" / "xdgdirs";
    std::filesystem::create_directories(config_dir);
    std::ofstream(config_dir / "config.toml") << "default_app = \"located\"\noutput = \"json\"\n";

    auto [code, output] = runCommand({{"HOME", home_}}, {"show", "--role", "data"});

    ASSERT_EQ(code, 0);
    auto json = nlohmann::json::parse(output);
    EXPECT_EQ(json["data"], home_ + "/.local/share/located");
}

TEST_F(XdgdirsCLITest, ExplicitMissingConfigFails) {
    auto [code, output] = runCommand(homeOnly(),
                                     {"--config", (temp_dir_ / "absent.toml").string(), "show", "app"});

    EXPECT_EQ(code, 1);
    EXPECT_NE(output.find("Config file not found"), std::string::npos);
}

TEST_F(XdgdirsCLITest, EnvPrintsResolvedVariables) {
    auto [code, output] = runCommand(homeOnly(), {"env", "go-xdg-test"});

    EXPECT_EQ(code, 0);
    EXPECT_EQ(output,
              "XDG_CONFIG_HOME='/home/t/.config/go-xdg-test'\n"
              "XDG_CACHE_HOME='/home/t/.cache/go-xdg-test'\n"
              "XDG_DATA_HOME='/home/t/.local/share/go-xdg-test'\n"
              "XDG_STATE_HOME='/home/t/.local/state/go-xdg-test'\n"
              "XDG_CONFIG_DIRS='/etc/xdg/go-xdg-test'\n"
              "XDG_DATA_DIRS='/usr/local/share/go-xdg-test:/usr/share/go-xdg-test'\n");
}

TEST_F(XdgdirsCLITest, EnvExport) {
    auto [code, output] = runCommand({}, {"env", "--export", "app"});

    EXPECT_EQ(code, 0);
    // Without HOME only the search paths resolve
    EXPECT_EQ(output,
              "export XDG_CONFIG_DIRS='/etc/xdg/app'\n"
              "export XDG_DATA_DIRS='/usr/local/share/app:/usr/share/app'\n");
}

TEST_F(XdgdirsCLITest, EnvJsonWithNothingResolved) {
    auto [code, output] = runCommand({{"XDG_CONFIG_DIRS", ""}, {"XDG_DATA_DIRS", ""}},
                                     {"--json", "env", "app"});

    ASSERT_EQ(code, 0);
    auto json = nlohmann::json::parse(output);
    EXPECT_TRUE(json.is_object());
    EXPECT_TRUE(json.empty());
}

TEST_F(XdgdirsCLITest, ShellQuote) {
    EXPECT_EQ(shellQuote("/plain/path"), "'/plain/path'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
}

TEST_F(XdgdirsCLITest, CreateDefaultRoles) {
    auto [code, output] = runCommand({{"HOME", home_}}, {"create", "myapp"});

    ASSERT_EQ(code, 0);
    EXPECT_TRUE(std::filesystem::is_directory(home_ + "/.config/myapp"));
    EXPECT_TRUE(std::filesystem::is_directory(home_ + "/.cache/myapp"));
    EXPECT_TRUE(std::filesystem::is_directory(home_ + "/.local/share/myapp"));
    EXPECT_TRUE(std::filesystem::is_directory(home_ + "/.local/state/myapp"));
    EXPECT_NE(output.find("cache\t" + home_ + "/.cache/myapp"), std::string::npos);
}

TEST_F(XdgdirsCLITest, CreateSkipsUnresolvedRuntime) {
    auto [code, output] = runCommand({{"HOME", home_}},
                                     {"--json", "create", "myapp", "--role", "runtime", "--role", "cache"});

    ASSERT_EQ(code, 0);
    auto json = nlohmann::json::parse(output);
    EXPECT_EQ(json["created"]["cache"], home_ + "/.cache/myapp");
    ASSERT_EQ(json["skipped"].size(), 1u);
    EXPECT_EQ(json["skipped"][0], "runtime");
}

TEST_F(XdgdirsCLITest, CreateRejectsSearchPathRole) {
    auto [code, output] = runCommand({{"HOME", home_}}, {"create", "myapp", "--role", "data-dirs"});

    EXPECT_EQ(code, 1);
    EXPECT_FALSE(std::filesystem::exists(home_ + "/.local/share/myapp"));
}

TEST_F(XdgdirsCLITest, CreateReportsFailure) {
    auto blocker = temp_dir_ / "blocker";
    std::ofstream(blocker) << "not a directory";

    auto [code, output] = runCommand({{"HOME", home_}, {"XDG_CACHE_HOME", blocker.string()}},
                                     {"create", "myapp", "--role", "cache"});

    EXPECT_EQ(code, 1);
    EXPECT_NE(output.find("Error: Cannot create directory"), std::string::npos);
}

} // namespace xdgdirs::cli
