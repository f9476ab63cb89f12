#include "utils/ReadExperimentConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;
using namespace riceair;

class ReadExperimentConfigurationFixture : public ::testing::Test {
protected:
    std::string baseTestDir = "temp_experiment_config_test_dir";
    fs::path original_cwd;

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::FATAL);
        original_cwd = fs::current_path();
        fs::remove_all(baseTestDir);
        fs::create_directories(baseTestDir);
        fs::current_path(baseTestDir);
    }

    void TearDown() override {
        fs::current_path(original_cwd);
        fs::remove_all(baseTestDir);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream file(name);
        file << content;
    }
};

TEST_F(ReadExperimentConfigurationFixture, ReadsModelRunConfiguration) {
    writeFile("experiment.txt",
              "# RICE+AIR experiment\n"
              "nsteps 59\n"
              "rho 0.001\n"
              "eta 1.45\n"
              "tau 0.5\n"
              "kuznets_term 1\n"
              "ssp_scenario ssp3\n"
              "\n"
              "hyears 2.5\n"
              "use_VSL true\n"
              "VOLY_elasticity 0.8\n"
              "unknown_setting 3\n");

    ModelRunConfiguration config = readModelRunConfiguration("experiment.txt");
    EXPECT_EQ(config.nsteps, 59);
    EXPECT_DOUBLE_EQ(config.rho, 0.001);
    EXPECT_DOUBLE_EQ(config.eta, 1.45);
    EXPECT_DOUBLE_EQ(config.tau, 0.5);
    EXPECT_DOUBLE_EQ(config.kuznets_term, 1.0);
    EXPECT_EQ(config.ssp_scenario, SSPScenario::SSP3);
    EXPECT_DOUBLE_EQ(config.hyears, 2.5);
    EXPECT_TRUE(config.use_VSL);
    EXPECT_DOUBLE_EQ(config.VOLY_elasticity, 0.8);
}

TEST_F(ReadExperimentConfigurationFixture, MissingNamesKeepDefaults) {
    writeFile("partial.txt", "rho 0.03\nuse_VSL 0\n");
    ModelRunConfiguration defaults;
    ModelRunConfiguration config = readModelRunConfiguration("partial.txt");
    EXPECT_DOUBLE_EQ(config.rho, 0.03);
    EXPECT_FALSE(config.use_VSL);
    EXPECT_EQ(config.nsteps, defaults.nsteps);
    EXPECT_EQ(config.ssp_scenario, defaults.ssp_scenario);
}

TEST_F(ReadExperimentConfigurationFixture, MalformedConfigurationThrows) {
    writeFile("bad_value.txt", "rho fast\n");
    EXPECT_THROW(readModelRunConfiguration("bad_value.txt"), DataFormatException);

    writeFile("missing_value.txt", "eta\n");
    EXPECT_THROW(readModelRunConfiguration("missing_value.txt"), DataFormatException);

    writeFile("extra_value.txt", "eta 1.5 2.0\n");
    EXPECT_THROW(readModelRunConfiguration("extra_value.txt"), DataFormatException);

    writeFile("fractional_steps.txt", "nsteps 10.5\n");
    EXPECT_THROW(readModelRunConfiguration("fractional_steps.txt"), DataFormatException);

    writeFile("huge_steps.txt", "nsteps 1e300\n");
    EXPECT_THROW(readModelRunConfiguration("huge_steps.txt"), DataFormatException);

    writeFile("nan_steps.txt", "nsteps nan\n");
    EXPECT_THROW(readModelRunConfiguration("nan_steps.txt"), DataFormatException);

    writeFile("bad_scenario.txt", "ssp_scenario SSP9\n");
    EXPECT_THROW(readModelRunConfiguration("bad_scenario.txt"), DataFormatException);

    writeFile("invalid.txt", "rho -0.5\n");
    EXPECT_THROW(readModelRunConfiguration("invalid.txt"), InvalidParameterException);

    EXPECT_THROW(readModelRunConfiguration("does_not_exist.txt"), FileIOException);
}

TEST_F(ReadExperimentConfigurationFixture, ReadsOptimizerSettingsAndAlgorithm) {
    writeFile("optimizer.txt",
              "# optimizer\n"
              "algorithm particle_swarm\n"
              "swarm_size 30\n"
              "ftol_rel 1e-10\n"
              "seed 42\n");

    auto settings = readOptimizerSettings("optimizer.txt");
    EXPECT_EQ(settings.size(), 3u);
    EXPECT_DOUBLE_EQ(settings.at("swarm_size"), 30.0);
    EXPECT_DOUBLE_EQ(settings.at("ftol_rel"), 1e-10);
    EXPECT_EQ(settings.count("algorithm"), 0u);

    EXPECT_EQ(readAlgorithmId("optimizer.txt"), "particle_swarm");

    writeFile("no_algorithm.txt", "seed 1\n");
    EXPECT_EQ(readAlgorithmId("no_algorithm.txt"), "hill_climbing");
    EXPECT_EQ(readAlgorithmId("no_algorithm.txt", "pso"), "pso");

    writeFile("bad_settings.txt", "swarm_size many\n");
    EXPECT_THROW(readOptimizerSettings("bad_settings.txt"), DataFormatException);
    EXPECT_THROW(readOptimizerSettings("missing.txt"), FileIOException);
}

TEST_F(ReadExperimentConfigurationFixture, ReadsLabelledAndPlainTaxVectors) {
    writeFile("labelled.txt",
              "# initial guess\n"
              "tax_period_2 150000\n"
              "tax_period_3 2.0e5 # inline comment\n");
    Eigen::VectorXd labelled = readTaxVector("labelled.txt");
    ASSERT_EQ(labelled.size(), 2);
    EXPECT_DOUBLE_EQ(labelled(0), 150000.0);
    EXPECT_DOUBLE_EQ(labelled(1), 200000.0);

    writeFile("plain.txt", "1 2 3\n4\n");
    Eigen::VectorXd plain = readTaxVector("plain.txt");
    ASSERT_EQ(plain.size(), 4);
    EXPECT_DOUBLE_EQ(plain(3), 4.0);

    writeFile("empty.txt", "# nothing here\n\n");
    EXPECT_THROW(readTaxVector("empty.txt"), DataFormatException);

    writeFile("bad_tax.txt", "tax_period_2 lots\n");
    EXPECT_THROW(readTaxVector("bad_tax.txt"), DataFormatException);
}

TEST_F(ReadExperimentConfigurationFixture, SavedPolicyCanBeReadBack) {
    PolicyOptimizationResult result;
    result.optimalTax.resize(3);
    result.optimalTax << 1234.5, 50000.0, 250000.0;
    result.taxTrajectory.resize(5);
    result.taxTrajectory << 0.0, 1234.5, 50000.0, 250000.0, 300000.0;
    result.welfare = 42.0;
    result.status = OptimizationStatus::FTOL_REACHED;

    saveOptimizationResults("policy.txt", result, "2024-01-01 00:00:00");

    std::ifstream file("policy.txt");
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("FTOL_REACHED"), std::string::npos);
    EXPECT_NE(content.find("2024-01-01 00:00:00"), std::string::npos);
    EXPECT_NE(content.find("tax_period_2"), std::string::npos);

    Eigen::VectorXd reread = readTaxVector("policy.txt");
    ASSERT_EQ(reread.size(), 3);
    EXPECT_TRUE(reread.isApprox(result.optimalTax));

    EXPECT_THROW(saveOptimizationResults("no_such_dir/policy.txt", result), FileIOException);
}
