#ifndef WELFARE_OBJECTIVE_FUNCTION_HPP
#define WELFARE_OBJECTIVE_FUNCTION_HPP

#include "rice_air/interfaces/IObjectiveFunction.hpp"
#include "rice_air/interfaces/IRiceAirModel.hpp"
#include "rice_air/BackstopPriceSchedule.hpp"
#include "rice_air/MitigationMapper.hpp"
#include "rice_air/ModelRunConfiguration.hpp"
#include "rice_air/PolicyNormalizer.hpp"
#include <Eigen/Dense>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace riceair {

    /**
     * @brief Outcome of one successful policy evaluation.
     */
    struct PolicyEvaluation {
        /// Tax vector after the backstop ceiling rule was applied.
        Eigen::VectorXd tax;
        /// Abatement matrix and full tax trajectory written into the model.
        MitigationSchedule schedule;
        /// Total welfare reported by the model.
        double welfare;
    };

    /**
     * @brief Summary of all evaluations performed by a WelfareObjectiveFunction.
     */
    struct EvaluationStatistics {
        std::size_t evaluations = 0;
        std::size_t failed_evaluations = 0;
        double welfare_mean = 0.0;
        double welfare_min = 0.0;
        double welfare_max = 0.0;
        double mean_run_seconds = 0.0;
    };

    /**
     * @brief Total welfare of the coupled model as a function of the carbon tax.
     *
     * Owns one model instance built from the experiment configuration and
     * reuses it for every evaluation; each call overwrites the abatement
     * inputs before running. The abatement matrix is written to both the
     * emissions and the air co-reduction component so that CO2 and air
     * pollutant controls stay consistent.
     */
    class WelfareObjectiveFunction : public IObjectiveFunction {
    public:
        /**
         * @brief Builds the model instance and prepares the mapping.
         *
         * @param[in] config Experiment configuration handed to the builder.
         * @param[in] backstop Backstop price schedule; must outlive the objective.
         * @param[in] nPeriods Number of optimized periods (tax vector length).
         * @param[in] includeCobenefits When false, health co-benefits are zeroed in the model.
         * @param[in] builder Factory for model instances.
         *
         * @throws InvalidParameterException If the configuration is invalid.
         * @throws ModelConstructionException If the builder returns no model.
         * @throws InvalidBackstopTableException If the model shape differs from the backstop table.
         * @throws InvalidTaxVectorException If nPeriods is outside [1, periods - 1].
         */
        WelfareObjectiveFunction(const ModelRunConfiguration& config,
                                 const BackstopPriceSchedule& backstop,
                                 int nPeriods,
                                 bool includeCobenefits,
                                 const IRiceAirModelBuilder& builder);

        /**
         * @brief Evaluates one tax vector.
         *
         * Applies the backstop ceiling rule to tax in place, maps it to abatement
         * levels, writes them into the model, runs it and reads total welfare.
         *
         * @param[in,out] tax Tax values for periods 2..n+1.
         * @return PolicyEvaluation The normalized tax, the schedule and the welfare.
         *
         * @throws InvalidTaxVectorException If tax has the wrong length or non-finite entries.
         * @throws SimulationException If the model run fails.
         * @throws EvaluationException If the reported welfare is not finite.
         * @throws InvalidResultException If the welfare output is not a scalar.
         */
        PolicyEvaluation evaluate(Eigen::VectorXd& tax);

        /**
         * @brief Optimizer callback: welfare of a tax vector, or -infinity.
         *
         * Run and evaluation failures are logged and turned into -infinity so
         * the optimizer discards the trial. Malformed input still throws.
         */
        double calculate(const Eigen::VectorXd& parameters) override;

        const std::vector<std::string>& getParameterNames() const override;

        /** @brief The model instance shared by all evaluations. */
        std::shared_ptr<IRiceAirModel> getModel() const { return model_; }

        bool includesCobenefits() const { return include_cobenefits_; }

        EvaluationStatistics getStatistics() const;

        /** @brief Writes getStatistics() to the logger at INFO level. */
        void logStatistics() const;

    private:
        using WelfareAccumulator = boost::accumulators::accumulator_set<double,
            boost::accumulators::stats<boost::accumulators::tag::count,
                                       boost::accumulators::tag::mean,
                                       boost::accumulators::tag::min,
                                       boost::accumulators::tag::max>>;
        using RunTimeAccumulator = boost::accumulators::accumulator_set<double,
            boost::accumulators::stats<boost::accumulators::tag::mean>>;

        const BackstopPriceSchedule& backstop_;
        MitigationMapper mapper_;
        PolicyNormalizer normalizer_;
        std::shared_ptr<IRiceAirModel> model_;
        int n_periods_;
        bool include_cobenefits_;
        std::vector<std::string> parameter_names_;

        WelfareAccumulator welfare_acc_;
        RunTimeAccumulator run_time_acc_;
        std::size_t evaluations_ = 0;
        std::size_t failed_evaluations_ = 0;

        void disableCobenefits();
    };

} // namespace riceair

#endif // WELFARE_OBJECTIVE_FUNCTION_HPP
