#include "rice_air/optimizers/OptimizerFactory.hpp"
#include "rice_air/optimizers/HillClimbingOptimizer.hpp"
#include "rice_air/optimizers/ParticleSwarmOptimizer.hpp"
#include "rice_air/optimizers/NloptOptimizer.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace riceair {

    std::unique_ptr<IOptimizationAlgorithm> OptimizerFactory::create(const std::string& algorithmId)
    {
        std::string id = algorithmId;
        std::transform(id.begin(), id.end(), id.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (id == "hill_climbing" || id == "hill") {
            return std::make_unique<HillClimbingOptimizer>();
        }
        if (id == "particle_swarm" || id == "pso") {
            return std::make_unique<ParticleSwarmOptimization>();
        }
        if (NloptOptimizer::resolve(algorithmId)) {
            return std::make_unique<NloptOptimizer>(algorithmId);
        }

        THROW_INVALID_PARAM("OptimizerFactory::create",
            "Unknown algorithm '" + algorithmId + "'. Valid algorithms: hill_climbing, particle_swarm"
            " or a derivative-free NLopt id such as LN_SBPLX, LN_COBYLA, LN_NELDERMEAD, GN_DIRECT.");
    }

    std::vector<std::string> OptimizerFactory::availableAlgorithms()
    {
        std::vector<std::string> names = {"hill_climbing", "particle_swarm"};
        for (const auto& name : NloptOptimizer::derivativeFreeAlgorithms()) {
            names.push_back(name);
        }
        return names;
    }

} // namespace riceair
