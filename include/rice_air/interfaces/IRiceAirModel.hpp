#ifndef I_RICE_AIR_MODEL_H
#define I_RICE_AIR_MODEL_H

#include "rice_air/ModelRunConfiguration.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>

namespace riceair {

/**
 * @class IRiceAirModel
 * @brief Run contract of the coupled climate-economy-air-pollution model.
 *
 * The optimizer never looks inside the model equations. It only:
 * - configures input parameters of a component,
 * - executes one full run over all time periods,
 * - reads output variables of a component,
 * - takes independent snapshots for baseline runs.
 *
 * Matrix-valued parameters and outputs are shaped [periods x regions];
 * scalar outputs are returned as 1x1 matrices.
 */
class IRiceAirModel {
public:
    virtual ~IRiceAirModel() = default;

    /**
     * @brief Assign an input parameter of a model component.
     *
     * @param component Component name (e.g. "emissions").
     * @param field Parameter name within the component (e.g. "MIU").
     * @param value New parameter value.
     *
     * @throws InvalidParameterException If the component/field is unknown or the shape is wrong.
     */
    virtual void setParameter(const std::string& component,
                              const std::string& field,
                              const Eigen::MatrixXd& value) = 0;

    /**
     * @brief Execute one full model run with the current inputs.
     *
     * @throws SimulationException If the run cannot be completed.
     */
    virtual void run() = 0;

    /**
     * @brief Read an output (or input) variable after a run.
     *
     * @throws InvalidParameterException If the component/field is unknown.
     * @throws SimulationException If the model has not been run yet.
     */
    virtual Eigen::MatrixXd getOutput(const std::string& component,
                                      const std::string& field) const = 0;

    /**
     * @brief Snapshot the model into an independent instance.
     *
     * The copy shares no mutable state with this instance, so both can be
     * reconfigured and run without affecting each other.
     */
    virtual std::unique_ptr<IRiceAirModel> clone() const = 0;

    /** @brief Number of time periods simulated by one run. */
    virtual int getNumPeriods() const = 0;

    /** @brief Number of regions. */
    virtual int getNumRegions() const = 0;
};

/**
 * @class IRiceAirModelBuilder
 * @brief Creates model instances for an experiment configuration.
 */
class IRiceAirModelBuilder {
public:
    virtual ~IRiceAirModelBuilder() = default;

    /**
     * @brief Build a fresh model instance.
     *
     * @throws ModelConstructionException If the instance cannot be created.
     */
    virtual std::shared_ptr<IRiceAirModel> build(const ModelRunConfiguration& config) const = 0;
};

} // namespace riceair

#endif // I_RICE_AIR_MODEL_H
