#ifndef BACKSTOP_PRICE_SCHEDULE_HPP
#define BACKSTOP_PRICE_SCHEDULE_HPP

#include <Eigen/Dense>

namespace riceair {

/**
 * @brief Regional backstop prices indexed by [time period, region].
 *
 * Values are held in calibration units (thousands of currency per tonne);
 * scaled() and periodMaximum() convert to currency per tonne. The table is
 * immutable after construction and every entry is finite and strictly positive.
 */
class BackstopPriceSchedule {
public:
    /**
     * @brief Builds the schedule from a raw calibration table.
     *
     * @param prices Matrix [periods x regions] in calibration units.
     * @throws InvalidBackstopTableException If the table has fewer than two periods,
     *         no regions, or any entry that is non-finite or not strictly positive.
     */
    explicit BackstopPriceSchedule(const Eigen::MatrixXd& prices);

    /** @brief Table in calibration units. */
    const Eigen::MatrixXd& raw() const { return raw_; }

    /** @brief Table in currency per tonne. */
    const Eigen::MatrixXd& scaled() const { return scaled_; }

    /**
     * @brief Per-period maximum scaled price across regions.
     *
     * This is the tax trajectory at which every region is fully decarbonized.
     */
    const Eigen::VectorXd& periodMaximum() const { return period_max_; }

    /**
     * @brief Ceiling for an optimization window covering model periods 2..n+1.
     *
     * @param n Number of optimized periods.
     * @return Eigen::VectorXd periodMaximum() entries 1..n (0-based).
     * @throws InvalidTaxVectorException If n is outside [1, numPeriods() - 1].
     */
    Eigen::VectorXd ceilingForOptimizedPeriods(int n) const;

    int numPeriods() const { return static_cast<int>(raw_.rows()); }
    int numRegions() const { return static_cast<int>(raw_.cols()); }

private:
    Eigen::MatrixXd raw_;
    Eigen::MatrixXd scaled_;
    Eigen::VectorXd period_max_;
};

} // namespace riceair

#endif // BACKSTOP_PRICE_SCHEDULE_HPP
