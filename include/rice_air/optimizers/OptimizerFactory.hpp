#ifndef OPTIMIZER_FACTORY_HPP
#define OPTIMIZER_FACTORY_HPP

#include "rice_air/interfaces/IOptimizationAlgorithm.hpp"
#include <memory>
#include <string>
#include <vector>

namespace riceair {
    /**
     * @class OptimizerFactory
     * @brief Creates optimization algorithms from their identifiers.
     *
     * Identifiers are matched case-insensitively. "hill_climbing" (alias "hill")
     * selects HillClimbingOptimizer and "particle_swarm" (alias "pso") selects
     * ParticleSwarmOptimization. Any other derivative-free NLopt identifier
     * ("LN_SBPLX", "GN_DIRECT", ...) selects NloptOptimizer.
     */
    class OptimizerFactory {
        public:
            /**
             * @brief Creates an unconfigured algorithm instance.
             *
             * @param algorithmId Algorithm identifier.
             * @return std::unique_ptr<IOptimizationAlgorithm> The new algorithm.
             *
             * @throws InvalidParameterException If the identifier is unknown or names a
             *         gradient-based NLopt algorithm; the message lists the valid identifiers.
             */
            static std::unique_ptr<IOptimizationAlgorithm> create(const std::string& algorithmId);

            /** @brief Canonical identifiers accepted by create(), in-tree algorithms first. */
            static std::vector<std::string> availableAlgorithms();
    };
}

#endif // OPTIMIZER_FACTORY_HPP
