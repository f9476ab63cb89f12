#include "gtest/gtest.h"
#include "rice_air/parameters/TaxParameterManager.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <limits>

using namespace riceair;
using namespace Eigen;

class TaxParameterManagerTest : public ::testing::Test {
protected:
    MatrixXd table;

    void SetUp() override {
        table.resize(6, 2);
        for (int t = 0; t < 6; ++t) {
            double pmax = 100.0 + 50.0 * t;
            table.row(t) << pmax, 0.5 * pmax;
        }
    }
};

TEST_F(TaxParameterManagerTest, BoundsAreZeroToCeiling) {
    BackstopPriceSchedule backstop(table);
    TaxParameterManager manager(backstop, 3);

    ASSERT_EQ(manager.getParameterCount(), 3u);
    EXPECT_TRUE(manager.getLowerBounds().isZero());
    EXPECT_DOUBLE_EQ(manager.getUpperBoundForParamIndex(0), 150000.0);
    EXPECT_DOUBLE_EQ(manager.getUpperBoundForParamIndex(2), 250000.0);
    EXPECT_DOUBLE_EQ(manager.getSigmaForParamIndex(1), 0.05 * 200000.0);

    const auto& names = manager.getParameterNames();
    EXPECT_EQ(names.front(), "tax_period_2");
    EXPECT_EQ(names.back(), "tax_period_4");

    EXPECT_THROW(manager.getUpperBoundForParamIndex(3), OutOfRangeException);
    EXPECT_THROW(manager.getSigmaForParamIndex(-1), OutOfRangeException);
}

TEST_F(TaxParameterManagerTest, ApplyConstraintsClampsAndNormalizes) {
    BackstopPriceSchedule backstop(table);
    TaxParameterManager manager(backstop, 4);

    VectorXd proposal(4);
    proposal << -10.0, 5e6, 1000.0, 2000.0;
    VectorXd constrained = manager.applyConstraints(proposal);

    // Clamping index 1 to its ceiling triggers the ceiling rule for the rest.
    VectorXd expected(4);
    expected << 0.0, 200000.0, 250000.0, 300000.0;
    EXPECT_TRUE(constrained.isApprox(expected));

    for (int i = 0; i < 4; ++i) {
        EXPECT_GE(constrained(i), manager.getLowerBoundForParamIndex(i));
        EXPECT_LE(constrained(i), manager.getUpperBoundForParamIndex(i));
    }
}

TEST_F(TaxParameterManagerTest, ApplyConstraintsParksNaNAtLowerBound) {
    BackstopPriceSchedule backstop(table);
    TaxParameterManager manager(backstop, 2);

    VectorXd proposal(2);
    proposal << std::numeric_limits<double>::quiet_NaN(), 1000.0;
    VectorXd constrained = manager.applyConstraints(proposal);
    EXPECT_DOUBLE_EQ(constrained(0), 0.0);
    EXPECT_DOUBLE_EQ(constrained(1), 1000.0);
}

TEST_F(TaxParameterManagerTest, UpdateStoresConstrainedPolicy) {
    BackstopPriceSchedule backstop(table);
    TaxParameterManager manager(backstop, 2);
    EXPECT_TRUE(manager.getCurrentParameters().isZero());

    VectorXd policy(2);
    policy << 1000.0, -5.0;
    manager.updateModelParameters(policy);
    EXPECT_DOUBLE_EQ(manager.getCurrentParameters()(0), 1000.0);
    EXPECT_DOUBLE_EQ(manager.getCurrentParameters()(1), 0.0);

    EXPECT_THROW(manager.updateModelParameters(VectorXd::Zero(3)), InvalidTaxVectorException);
}

TEST_F(TaxParameterManagerTest, ValidateInitialGuess) {
    BackstopPriceSchedule backstop(table);
    TaxParameterManager manager(backstop, 3);

    VectorXd ok(3);
    ok << 0.0, 100000.0, 250000.0;
    EXPECT_NO_THROW(manager.validateInitialGuess(ok));

    EXPECT_THROW(manager.validateInitialGuess(VectorXd::Zero(2)), InvalidTaxVectorException);

    VectorXd above = ok;
    above(0) = 150000.5;
    EXPECT_THROW(manager.validateInitialGuess(above), InvalidBoundsException);

    VectorXd negative = ok;
    negative(2) = -1.0;
    EXPECT_THROW(manager.validateInitialGuess(negative), InvalidBoundsException);

    VectorXd nan = ok;
    nan(1) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(manager.validateInitialGuess(nan), InvalidBoundsException);
}

TEST_F(TaxParameterManagerTest, RejectsInvalidWindow) {
    BackstopPriceSchedule backstop(table);
    EXPECT_THROW(TaxParameterManager(backstop, 0), InvalidTaxVectorException);
    EXPECT_THROW(TaxParameterManager(backstop, 6), InvalidTaxVectorException);
    EXPECT_THROW(TaxParameterManager(backstop, 2, 0.0), InvalidParameterException);
}
