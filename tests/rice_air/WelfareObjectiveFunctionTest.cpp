#include "gtest/gtest.h"
#include "rice_air/objectives/WelfareObjectiveFunction.hpp"
#include "rice_air/ModelConstants.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "TestRiceAirModel.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>

using namespace riceair;
using namespace riceair::test;
using namespace Eigen;

class WelfareObjectiveFunctionTest : public ::testing::Test {
protected:
    int periods = 6;
    int regions = 2;
    MatrixXd table;
    ModelRunConfiguration config;

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
};

TEST_F(WelfareObjectiveFunctionTest, WritesAbatementIntoBothComponents) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    WelfareObjectiveFunction objective(config, backstop, 3, true, builder);

    VectorXd tax(3);
    tax << 50000.0, 80000.0, 120000.0;
    PolicyEvaluation evaluation = objective.evaluate(tax);

    auto model = builder.lastModel();
    ASSERT_NE(model, nullptr);
    MatrixXd co2 = model->getOutput(fields::EMISSIONS, fields::MIU);
    MatrixXd air = model->getOutput(fields::AIR_COREDUCTION, fields::MIU);
    EXPECT_TRUE(co2.isApprox(evaluation.schedule.abatement));
    EXPECT_TRUE(air.isApprox(evaluation.schedule.abatement));
    EXPECT_EQ(model->setCount(fields::EMISSIONS, fields::MIU), 1);
    EXPECT_EQ(model->setCount(fields::AIR_COREDUCTION, fields::MIU), 1);
    EXPECT_EQ(model->runCount(), 1);

    double reported = model->getOutput(fields::WELFARE, fields::WELFARE_TOTAL)(0, 0);
    EXPECT_DOUBLE_EQ(evaluation.welfare, reported);
    EXPECT_TRUE(std::isfinite(evaluation.welfare));
}

TEST_F(WelfareObjectiveFunctionTest, EvaluateNormalizesTaxInPlace) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    WelfareObjectiveFunction objective(config, backstop, 4, true, builder);

    VectorXd tax(4);
    tax << 150000.0, 205000.0, 250000.0, 300000.0;
    PolicyEvaluation evaluation = objective.evaluate(tax);

    VectorXd expected(4);
    expected << 150000.0, 200000.0, 250000.0, 300000.0;
    EXPECT_TRUE(tax.isApprox(expected));
    EXPECT_TRUE(evaluation.tax.isApprox(expected));
    EXPECT_DOUBLE_EQ(evaluation.schedule.tax(2), 200000.0);
}

TEST_F(WelfareObjectiveFunctionTest, CalculateMatchesEvaluate) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    WelfareObjectiveFunction objective(config, backstop, 2, true, builder);

    VectorXd tax(2);
    tax << 40000.0, 60000.0;
    double viaCalculate = objective.calculate(tax);
    VectorXd copy = tax;
    double viaEvaluate = objective.evaluate(copy).welfare;
    EXPECT_DOUBLE_EQ(viaCalculate, viaEvaluate);

    const auto& names = objective.getParameterNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "tax_period_2");
    EXPECT_EQ(names[1], "tax_period_3");
}

TEST_F(WelfareObjectiveFunctionTest, ExcludingCobenefitsZeroesHealthInputs) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builderWith(periods, regions);
    TestRiceAirModelBuilder builderWithout(periods, regions);
    WelfareObjectiveFunction with(config, backstop, 2, true, builderWith);
    WelfareObjectiveFunction without(config, backstop, 2, false, builderWithout);

    auto model = builderWithout.lastModel();
    EXPECT_TRUE(model->getOutput(fields::AIR_CONSUMPTION, fields::LIFEYEARS).isZero());
    EXPECT_TRUE(model->getOutput(fields::AIR_CONSUMPTION, fields::AVOIDED_DEATHS).isZero());
    EXPECT_FALSE(builderWith.lastModel()->getOutput(fields::AIR_CONSUMPTION, fields::LIFEYEARS).isZero());

    VectorXd tax(2);
    tax << 40000.0, 60000.0;
    EXPECT_GT(with.calculate(tax), without.calculate(tax));
    EXPECT_FALSE(without.includesCobenefits());
}

TEST_F(WelfareObjectiveFunctionTest, NonFiniteWelfareBecomesSentinel) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    builder.setNanWelfare(true);
    WelfareObjectiveFunction objective(config, backstop, 2, true, builder);

    VectorXd tax = VectorXd::Constant(2, 1000.0);
    double value = objective.calculate(tax);
    EXPECT_TRUE(std::isinf(value));
    EXPECT_LT(value, 0.0);

    EXPECT_THROW(objective.evaluate(tax), EvaluationException);

    EvaluationStatistics stats = objective.getStatistics();
    EXPECT_EQ(stats.evaluations, 2u);
    EXPECT_EQ(stats.failed_evaluations, 2u);
}

TEST_F(WelfareObjectiveFunctionTest, FailedRunBecomesSentinel) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    builder.setFailRuns(true);
    WelfareObjectiveFunction objective(config, backstop, 2, true, builder);

    VectorXd tax = VectorXd::Constant(2, 1000.0);
    EXPECT_EQ(objective.calculate(tax), -std::numeric_limits<double>::infinity());
    EXPECT_THROW(objective.evaluate(tax), SimulationException);
}

TEST_F(WelfareObjectiveFunctionTest, MalformedTaxStillThrowsFromCalculate) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    WelfareObjectiveFunction objective(config, backstop, 2, true, builder);

    EXPECT_THROW(objective.calculate(VectorXd::Zero(3)), InvalidTaxVectorException);
    VectorXd nan(2);
    nan << 1.0, std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(objective.calculate(nan), InvalidTaxVectorException);
}

TEST_F(WelfareObjectiveFunctionTest, ReusesOneModelInstance) {
    BackstopPriceSchedule backstop(table);
    TestRiceAirModelBuilder builder(periods, regions);
    WelfareObjectiveFunction objective(config, backstop, 2, true, builder);

    for (int i = 0; i < 5; ++i) {
        objective.calculate(VectorXd::Constant(2, 1000.0 * (i + 1)));
    }
    EXPECT_EQ(builder.buildCount(), 1);
    EXPECT_EQ(builder.lastModel()->runCount(), 5);
    EXPECT_EQ(objective.getModel(), std::static_pointer_cast<IRiceAirModel>(builder.lastModel()));

    EvaluationStatistics stats = objective.getStatistics();
    EXPECT_EQ(stats.evaluations, 5u);
    EXPECT_EQ(stats.failed_evaluations, 0u);
    EXPECT_LE(stats.welfare_min, stats.welfare_mean);
    EXPECT_LE(stats.welfare_mean, stats.welfare_max);
    EXPECT_GE(stats.mean_run_seconds, 0.0);
}

TEST_F(WelfareObjectiveFunctionTest, ConstructionErrors) {
    BackstopPriceSchedule backstop(table);

    TestRiceAirModelBuilder nullBuilder(periods, regions);
    nullBuilder.setReturnNull(true);
    EXPECT_THROW(WelfareObjectiveFunction(config, backstop, 2, true, nullBuilder), ModelConstructionException);

    TestRiceAirModelBuilder wrongShape(periods + 1, regions);
    EXPECT_THROW(WelfareObjectiveFunction(config, backstop, 2, true, wrongShape), InvalidBackstopTableException);

    TestRiceAirModelBuilder builder(periods, regions);
    EXPECT_THROW(WelfareObjectiveFunction(config, backstop, 0, true, builder), InvalidTaxVectorException);
    EXPECT_THROW(WelfareObjectiveFunction(config, backstop, periods, true, builder), InvalidTaxVectorException);

    ModelRunConfiguration bad = config;
    bad.rho = -1.0;
    EXPECT_THROW(WelfareObjectiveFunction(bad, backstop, 2, true, builder), InvalidParameterException);
}
