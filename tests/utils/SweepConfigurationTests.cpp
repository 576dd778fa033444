#include "utils/SweepConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace episweep;

class SweepConfigurationFixture : public ::testing::Test {
protected:
    std::string testDir = "temp_sweep_config_test_dir";

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::string writeConfig(const std::string& name, const std::string& contents) {
        std::string path = testDir + "/" + name;
        std::ofstream file(path);
        file << contents;
        return path;
    }
};

TEST_F(SweepConfigurationFixture, ReadSettingsFile_CommentsAndWhitespace) {
    std::string path = writeConfig("settings.txt",
                                   "# header comment\n"
                                   "\n"
                                   "   gamma    0.1   # trailing comment\n"
                                   "\tsolver\trkf45\t\n"
                                   "output_html out/graph.html\n");
    std::map<std::string, std::string> settings = readSettingsFile(path);
    ASSERT_EQ(settings.size(), 3u);
    EXPECT_EQ(settings["gamma"], "0.1");
    EXPECT_EQ(settings["solver"], "rkf45");
    EXPECT_EQ(settings["output_html"], "out/graph.html");
}

TEST_F(SweepConfigurationFixture, ReadSettingsFile_Errors) {
    EXPECT_THROW(readSettingsFile(testDir + "/does_not_exist.txt"), FileIOException);
    EXPECT_THROW(readSettingsFile(writeConfig("missing.txt", "gamma\n")), DataFormatException);
    EXPECT_THROW(readSettingsFile(writeConfig("extra.txt", "gamma 0.1 0.2\n")), DataFormatException);
    EXPECT_THROW(readSettingsFile(writeConfig("twice.txt", "gamma 0.1\ngamma 0.2\n")), DataFormatException);
}

TEST_F(SweepConfigurationFixture, ReadSweepConfiguration_OverridesDefaults) {
    std::string path = writeConfig("sird.txt",
                                   "N 1e6\n"
                                   "alpha 0.05\n"
                                   "beta_start 0.1\n"
                                   "beta_stop 0.5\n"
                                   "beta_step 0.1\n"
                                   "default_beta 0.3\n"
                                   "t_end 180\n"
                                   "num_tsteps 361\n"
                                   "solver rkf45\n"
                                   "log_level debug\n");
    SweepSettings settings = readSweepConfiguration(path, defaultSIRDSettings());

    EXPECT_DOUBLE_EQ(settings.N, 1e6);
    EXPECT_DOUBLE_EQ(settings.alpha, 0.05);
    EXPECT_DOUBLE_EQ(settings.gamma, constants::DEFAULT_GAMMA);
    EXPECT_EQ(settings.beta_grid.count(), 5);
    EXPECT_DOUBLE_EQ(settings.default_beta, 0.3);
    EXPECT_DOUBLE_EQ(settings.end_time, 180.0);
    EXPECT_EQ(settings.num_tsteps, 361);
    EXPECT_EQ(settings.solver, "rkf45");
    EXPECT_EQ(settings.log_level, "debug");
    EXPECT_EQ(settings.output_html, "sird-graph.html");
}

TEST_F(SweepConfigurationFixture, ReadSweepConfiguration_OutputKeys) {
    SweepSettings defaults = defaultSEIRSettings();
    EXPECT_NE(defaults.plotly_js, "cdn");
    EXPECT_TRUE(defaults.log_file.empty());

    std::string path = writeConfig("output.txt",
                                   "plotly_js /usr/share/javascript/plotly/plotly.min.js\n"
                                   "log_file logs/seir.log\n");
    SweepSettings settings = readSweepConfiguration(path, defaults);
    EXPECT_EQ(settings.plotly_js, "/usr/share/javascript/plotly/plotly.min.js");
    EXPECT_EQ(settings.log_file, "logs/seir.log");

    EXPECT_EQ(readSweepConfiguration(writeConfig("cdn.txt", "plotly_js cdn\n"), defaults).plotly_js, "cdn");
}

TEST_F(SweepConfigurationFixture, ReadSweepConfiguration_UnknownKeysIgnored) {
    std::string path = writeConfig("unknown.txt", "gamma 0.2\ncolour blue\n");
    SweepSettings settings;
    ASSERT_NO_THROW(settings = readSweepConfiguration(path, defaultSEIRSettings()));
    EXPECT_DOUBLE_EQ(settings.gamma, 0.2);
}

TEST_F(SweepConfigurationFixture, ReadSweepConfiguration_BadValues) {
    SweepSettings defaults = defaultSEIRSettings();
    EXPECT_THROW(readSweepConfiguration(writeConfig("nan.txt", "gamma fast\n"), defaults), DataFormatException);
    EXPECT_THROW(readSweepConfiguration(writeConfig("partial.txt", "gamma 0.1x\n"), defaults), DataFormatException);
    EXPECT_THROW(readSweepConfiguration(writeConfig("steps.txt", "num_tsteps 7.5\n"), defaults), DataFormatException);
    EXPECT_THROW(readSweepConfiguration(writeConfig("level.txt", "log_level loud\n"), defaults), DataFormatException);
}

TEST_F(SweepConfigurationFixture, ReadSweepConfiguration_InconsistentSettings) {
    SweepSettings defaults = defaultSEIRSettings();
    EXPECT_THROW(readSweepConfiguration(writeConfig("grid.txt", "beta_start 0.9\nbeta_stop 0.1\n"), defaults),
                 InvalidParameterException);
    EXPECT_THROW(readSweepConfiguration(writeConfig("solver.txt", "solver euler\n"), defaults),
                 InvalidParameterException);
    EXPECT_THROW(readSweepConfiguration(writeConfig("alpha.txt", "alpha 1.2\n"), defaults),
                 InvalidParameterException);
}

TEST(BetaGridTest, DefaultGridHasOneHundredValues) {
    BetaGrid grid;
    std::vector<double> values = grid.values();
    ASSERT_EQ(values.size(), 100u);
    EXPECT_DOUBLE_EQ(values.front(), 0.01);
    EXPECT_DOUBLE_EQ(values[49], 0.5);
    EXPECT_DOUBLE_EQ(values.back(), 1.0);
}

TEST(BetaGridTest, PartialLastStepStaysBelowStop) {
    BetaGrid grid{0.0, 0.25, 0.1};
    std::vector<double> values = grid.values();
    ASSERT_EQ(grid.count(), 3);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(values.back(), 0.2);
    for (double beta : values) {
        EXPECT_LE(beta, grid.stop);
    }
}

TEST(BetaGridTest, StopOnTheGridIsKept) {
    BetaGrid grid{0.1, 0.9, 0.2};
    std::vector<double> values = grid.values();
    ASSERT_EQ(values.size(), 5u);
    EXPECT_DOUBLE_EQ(values.back(), 0.9);

    BetaGrid single{0.3, 0.3, 0.1};
    ASSERT_EQ(single.values().size(), 1u);
    EXPECT_DOUBLE_EQ(single.values().front(), 0.3);
}

TEST(BetaGridTest, InvalidGrids) {
    BetaGrid grid;
    grid.step = 0.0;
    EXPECT_THROW(grid.values(), InvalidParameterException);
    grid = BetaGrid();
    grid.start = -0.1;
    EXPECT_THROW(grid.count(), InvalidParameterException);
}
