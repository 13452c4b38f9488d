#include <gtest/gtest.h>
#include <opf/config/config_helpers.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>

namespace opf::config::test {

namespace fs = std::filesystem;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("opf_config_test_" + std::to_string(rd()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
        ::unsetenv("OPF_CONFIG_PATH");
    }

    fs::path write(const std::string& name, const std::string& content) {
        auto p = dir_ / name;
        std::ofstream out(p);
        out << content;
        return p;
    }

    fs::path dir_;
};

TEST_F(ConfigHelpersTest, ParsesSectionsQuotesAndComments) {
    auto path = write("config.toml", R"(# top comment
name = "opf"

[server]
listen_address = "unix:///tmp/x.sock"  # trailing comment
max_connections = 5
io_threads = '3'

[empty]
)");

    auto kv = parseSimpleTomlFlat(path);
    EXPECT_EQ(kv["name"], "opf");
    EXPECT_EQ(kv["server.listen_address"], "unix:///tmp/x.sock");
    EXPECT_EQ(kv["server.max_connections"], "5");
    EXPECT_EQ(kv["server.io_threads"], "3");
    EXPECT_EQ(kv.size(), 4u);
}

TEST_F(ConfigHelpersTest, MissingFileYieldsEmptyMap) {
    EXPECT_TRUE(parseSimpleTomlFlat(dir_ / "nope.toml").empty());
}

TEST(ConfigParseTest, ParseUnsigned) {
    EXPECT_EQ(parseUnsigned("42"), 42u);
    EXPECT_EQ(parseUnsigned("  7 "), 7u);
    EXPECT_FALSE(parseUnsigned("").has_value());
    EXPECT_FALSE(parseUnsigned("-1").has_value());
    EXPECT_FALSE(parseUnsigned("12abc").has_value());
    EXPECT_FALSE(parseUnsigned("99999999999999999999999").has_value());
}

TEST_F(ConfigHelpersTest, ExplicitConfigPathWins) {
    auto path = write("explicit.toml", "a = 1\n");
    ::setenv("OPF_CONFIG_PATH", path.c_str(), 1);
    EXPECT_EQ(resolveDefaultConfigPath(), path);
}

} // namespace opf::config::test
