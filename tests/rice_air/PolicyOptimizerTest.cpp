#include "gtest/gtest.h"
#include "rice_air/PolicyOptimizer.hpp"
#include "rice_air/MitigationMapper.hpp"
#include "rice_air/ModelConstants.hpp"
#include "rice_air/PolicyNormalizer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "TestRiceAirModel.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <map>
#include <string>

using namespace riceair;
using namespace riceair::test;
using namespace Eigen;

class PolicyOptimizerTest : public ::testing::Test {
protected:
    int periods = 6;
    int regions = 2;
    MatrixXd table;
    ModelRunConfiguration config;
    std::map<std::string, double> quick = {{"seed", 1.0}, {"iterations", 300.0}};

    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        table.resize(periods, regions);
        for (int t = 0; t < periods; ++t) {
            double pmax = 100.0 + 50.0 * t;
            table.row(t) << pmax, 0.5 * pmax;
        }
        config.nsteps = periods;
    }

    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    void expectConsistent(const PolicyOptimizationResult& result, const BackstopPriceSchedule& backstop) {
        ASSERT_NE(result.model, nullptr);
        MitigationMapper mapper(backstop);
        MitigationSchedule expected = mapper.map(result.optimalTax);
        EXPECT_TRUE(result.abatement.isApprox(expected.abatement));
        EXPECT_TRUE(result.taxTrajectory.isApprox(expected.tax));
        EXPECT_DOUBLE_EQ(result.taxTrajectory(0), 0.0);
        EXPECT_EQ(PolicyNormalizer(backstop).normalize(result.optimalTax), result.optimalTax);

        // The returned model was last run with the returned policy.
        EXPECT_TRUE(result.model->getOutput(fields::EMISSIONS, fields::MIU).isApprox(result.abatement));
        EXPECT_TRUE(result.model->getOutput(fields::AIR_COREDUCTION, fields::MIU).isApprox(result.abatement));
        EXPECT_DOUBLE_EQ(result.model->getOutput(fields::WELFARE, fields::WELFARE_TOTAL)(0, 0), result.welfare);

        VectorXd ceiling = backstop.ceilingForOptimizedPeriods(static_cast<int>(result.optimalTax.size()));
        for (int i = 0; i < result.optimalTax.size(); ++i) {
            EXPECT_GE(result.optimalTax(i), 0.0) << "period " << i + 2;
            EXPECT_LE(result.optimalTax(i), ceiling(i)) << "period " << i + 2;
        }
    }
};

TEST_F(PolicyOptimizerTest, HillClimbingImprovesOnInitialGuess) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    VectorXd guess = VectorXd::Zero(3);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "hill_climbing", 3, 30.0, 1e-10, backstop, true, guess, builder, quick);

    expectConsistent(result, backstop);
    EXPECT_NE(result.status, OptimizationStatus::FAILURE);
    EXPECT_GT(result.evaluations, 0);
    EXPECT_GT(result.iterations, 0);
    EXPECT_EQ(builder.buildCount(), 1);

    TestRiceAirModel reference(periods, regions);
    MitigationMapper mapper(backstop);
    MatrixXd zeroPolicy = mapper.map(guess).abatement;
    reference.setParameter(fields::EMISSIONS, fields::MIU, zeroPolicy);
    reference.setParameter(fields::AIR_COREDUCTION, fields::MIU, zeroPolicy);
    reference.run();
    EXPECT_GT(result.welfare, reference.getOutput(fields::WELFARE, fields::WELFARE_TOTAL)(0, 0));
    EXPECT_GT(result.optimalTax.maxCoeff(), 0.0);
}

TEST_F(PolicyOptimizerTest, ParticleSwarmReturnsConsistentState) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "PSO", 2, 30.0, 1e-10, backstop, true, VectorXd::Zero(2), builder,
        {{"seed", 4.0}, {"iterations", 20.0}, {"swarm_size", 6.0}});

    expectConsistent(result, backstop);
    EXPECT_NE(result.status, OptimizationStatus::FAILURE);
}

TEST_F(PolicyOptimizerTest, NloptSubplexImprovesOnZeroPolicy) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    VectorXd guess = VectorXd::Zero(3);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "LN_SBPLX", 3, 30.0, 1e-10, backstop, true, guess, builder);

    expectConsistent(result, backstop);
    EXPECT_EQ(result.status, OptimizationStatus::FTOL_REACHED);
    EXPECT_GT(result.evaluations, 0);

    TestRiceAirModel reference(periods, regions);
    MatrixXd zeroPolicy = MitigationMapper(backstop).map(guess).abatement;
    reference.setParameter(fields::EMISSIONS, fields::MIU, zeroPolicy);
    reference.setParameter(fields::AIR_COREDUCTION, fields::MIU, zeroPolicy);
    reference.run();
    EXPECT_GT(result.welfare, reference.getOutput(fields::WELFARE, fields::WELFARE_TOTAL)(0, 0));
}

TEST_F(PolicyOptimizerTest, NloptGlobalSearchHonoursEvaluationCap) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "gn_direct", 2, 30.0, 1e-12, backstop, true, VectorXd::Zero(2), builder,
        {{"iterations", 200.0}});

    expectConsistent(result, backstop);
    EXPECT_EQ(result.status, OptimizationStatus::MAXITER_REACHED);
    EXPECT_LE(result.evaluations, 200);
}

TEST_F(PolicyOptimizerTest, FullDecarbonizationOptimumSitsOnTheCeiling) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    // Marginal welfare 10 - 2 mu stays positive on [0, 1].
    builder.setWelfareShape(10.0, 1.0);
    VectorXd ceiling = backstop.ceilingForOptimizedPeriods(3);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "hill_climbing", 3, 30.0, 1e-12, backstop, true, 0.9 * ceiling, builder,
        {{"seed", 9.0}, {"iterations", 2000.0}});

    expectConsistent(result, backstop);
    for (int i = 0; i < 3; ++i) {
        EXPECT_NEAR(result.optimalTax(i), ceiling(i), 1e-6 * ceiling(i)) << "period " << i + 2;
    }
    for (int t = 4; t < periods; ++t) {
        EXPECT_DOUBLE_EQ(result.taxTrajectory(t), backstop.periodMaximum()(t));
    }
    for (int t = 1; t < periods; ++t) {
        for (int r = 0; r < regions; ++r) {
            EXPECT_NEAR(result.abatement(t, r), 1.0, 1e-6) << "period " << t + 1 << " region " << r;
        }
    }
}

TEST_F(PolicyOptimizerTest, ExplicitIterationCapIsHonoured) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "hill_climbing", 2, 30.0, 1e-10, backstop, true, VectorXd::Zero(2), builder,
        {{"seed", 5.0}, {"iterations", 3.0}});

    EXPECT_EQ(result.status, OptimizationStatus::MAXITER_REACHED);
    EXPECT_EQ(result.iterations, 3);
}

TEST_F(PolicyOptimizerTest, WithoutIterationSettingOnlyTimeOrToleranceStopTheRun) {
    BackstopPriceSchedule backstop(table);

    TestRiceAirModelBuilder hillBuilder(periods, regions);
    PolicyOptimizationResult hill = PolicyOptimizer::optimize(
        config, "hill_climbing", 2, 1.0, 1e-300, backstop, true, VectorXd::Zero(2), hillBuilder,
        {{"seed", 6.0}});
    EXPECT_NE(hill.status, OptimizationStatus::MAXITER_REACHED);
    EXPECT_NE(hill.status, OptimizationStatus::FAILURE);

    TestRiceAirModelBuilder swarmBuilder(periods, regions);
    PolicyOptimizationResult swarm = PolicyOptimizer::optimize(
        config, "pso", 2, 1.0, 1e-300, backstop, true, VectorXd::Zero(2), swarmBuilder,
        {{"seed", 6.0}, {"swarm_size", 4.0}});
    EXPECT_NE(swarm.status, OptimizationStatus::MAXITER_REACHED);
    EXPECT_NE(swarm.status, OptimizationStatus::FAILURE);
}

TEST_F(PolicyOptimizerTest, ExcludedCobenefitsReachTheModel) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "hill", 2, 30.0, 1e-10, backstop, false, VectorXd::Zero(2), builder,
        {{"seed", 2.0}, {"iterations", 20.0}});

    EXPECT_TRUE(result.model->getOutput(fields::AIR_CONSUMPTION, fields::LIFEYEARS).isZero());
    EXPECT_TRUE(result.model->getOutput(fields::AIR_CONSUMPTION, fields::AVOIDED_DEATHS).isZero());
    EXPECT_EQ(builder.lastConfig().nsteps, periods);
}

TEST_F(PolicyOptimizerTest, TimeLimitIsNotAnError) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);

    PolicyOptimizationResult result = PolicyOptimizer::optimize(
        config, "hill_climbing", 2, 1e-9, 1e-10, backstop, true, VectorXd::Zero(2), builder);

    EXPECT_EQ(result.status, OptimizationStatus::MAXTIME_REACHED);
    EXPECT_TRUE(std::isfinite(result.welfare));
    expectConsistent(result, backstop);
}

TEST_F(PolicyOptimizerTest, InvalidArgumentsFailBeforeAnyModelIsBuilt) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    VectorXd guess = VectorXd::Zero(2);

    EXPECT_THROW(PolicyOptimizer::optimize(config, "hill", 0, 10.0, 1e-6, backstop, true, VectorXd(0), builder),
                 InvalidTaxVectorException);
    EXPECT_THROW(PolicyOptimizer::optimize(config, "hill", periods, 10.0, 1e-6, backstop, true,
                                           VectorXd::Zero(periods), builder),
                 InvalidTaxVectorException);

    ModelRunConfiguration mismatched = config;
    mismatched.nsteps = periods + 1;
    EXPECT_THROW(PolicyOptimizer::optimize(mismatched, "hill", 2, 10.0, 1e-6, backstop, true, guess, builder),
                 InvalidBackstopTableException);

    ModelRunConfiguration invalid = config;
    invalid.hyears = -1.0;
    EXPECT_THROW(PolicyOptimizer::optimize(invalid, "hill", 2, 10.0, 1e-6, backstop, true, guess, builder),
                 InvalidParameterException);

    EXPECT_THROW(PolicyOptimizer::optimize(config, "hill", 2, 0.0, 1e-6, backstop, true, guess, builder),
                 InvalidParameterException);
    EXPECT_THROW(PolicyOptimizer::optimize(config, "hill", 2, 10.0, -1e-6, backstop, true, guess, builder),
                 InvalidParameterException);
    EXPECT_THROW(PolicyOptimizer::optimize(config, "XX_UNKNOWN", 2, 10.0, 1e-6, backstop, true, guess, builder),
                 InvalidParameterException);
    EXPECT_THROW(PolicyOptimizer::optimize(config, "LD_MMA", 2, 10.0, 1e-6, backstop, true, guess, builder),
                 InvalidParameterException);

    EXPECT_THROW(PolicyOptimizer::optimize(config, "hill", 2, 10.0, 1e-6, backstop, true,
                                           VectorXd::Zero(3), builder),
                 InvalidTaxVectorException);
    VectorXd tooHigh(2);
    tooHigh << 1e9, 0.0;
    EXPECT_THROW(PolicyOptimizer::optimize(config, "hill", 2, 10.0, 1e-6, backstop, true, tooHigh, builder),
                 InvalidBoundsException);

    EXPECT_EQ(builder.buildCount(), 0);
}

TEST_F(PolicyOptimizerTest, NoFiniteWelfareIsAnEvaluationError) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    builder.setNanWelfare(true);

    EXPECT_THROW(PolicyOptimizer::optimize(config, "hill", 2, 10.0, 1e-6, backstop, true,
                                           VectorXd::Zero(2), builder, {{"iterations", 5.0}}),
                 EvaluationException);
    EXPECT_EQ(builder.buildCount(), 1);
}
