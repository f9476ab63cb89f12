#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>
#include <iomanip>
#include <map>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include "utils/ReadExperimentConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

static void trim(std::string& line) {
    line.erase(0, line.find_first_not_of(" \t\n\r\f\v"));
    line.erase(line.find_last_not_of(" \t\n\r\f\v") + 1);
}

static bool parseNumber(const std::string& token, double& value) {
    try {
        size_t pos = 0;
        value = std::stod(token, &pos);
        return pos == token.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static std::ifstream openOrThrow(const std::string& filename, const std::string& calling_function_name) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        riceair::Logger::getInstance().error("ReadExperimentConfiguration::" + calling_function_name, "Unable to open file: " + filename);
        throw riceair::FileIOException(calling_function_name, "Unable to open file: " + filename);
    }
    return file;
}

static double requireNumber(const std::string& name, const std::string& token, int line_number) {
    double value = 0.0;
    if (!parseNumber(token, value)) {
        throw riceair::DataFormatException("readModelRunConfiguration",
            "Invalid value '" + token + "' for " + name + " on line " + std::to_string(line_number));
    }
    return value;
}

static bool parseFlag(const std::string& name, std::string token, int line_number) {
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (token == "true" || token == "yes") return true;
    if (token == "false" || token == "no") return false;
    return requireNumber(name, token, line_number) != 0.0;
}


// --- Main Functions ---

riceair::ModelRunConfiguration readModelRunConfiguration(const std::string& filename) {
    std::ifstream file = openOrThrow(filename, "readModelRunConfiguration");

    riceair::ModelRunConfiguration config;
    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        line_number++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string name, token;
        if (!(iss >> name >> token)) {
            throw riceair::DataFormatException("readModelRunConfiguration",
                "Missing value on line " + std::to_string(line_number) + ": " + line);
        }
        std::string extra;
        if (iss >> extra) {
            throw riceair::DataFormatException("readModelRunConfiguration",
                "Too many values on line " + std::to_string(line_number) + ": " + line);
        }

        if (name == "nsteps") {
            double steps = requireNumber(name, token, line_number);
            if (!std::isfinite(steps) || std::floor(steps) != steps ||
                steps < std::numeric_limits<int>::min() || steps > std::numeric_limits<int>::max()) {
                throw riceair::DataFormatException("readModelRunConfiguration",
                    "nsteps must be an integer on line " + std::to_string(line_number));
            }
            config.nsteps = static_cast<int>(steps);
        }
        else if (name == "rho") config.rho = requireNumber(name, token, line_number);
        else if (name == "eta") config.eta = requireNumber(name, token, line_number);
        else if (name == "tau") config.tau = requireNumber(name, token, line_number);
        else if (name == "kuznets_term") config.kuznets_term = requireNumber(name, token, line_number);
        else if (name == "hyears") config.hyears = requireNumber(name, token, line_number);
        else if (name == "VOLY_elasticity") config.VOLY_elasticity = requireNumber(name, token, line_number);
        else if (name == "use_VSL") config.use_VSL = parseFlag(name, token, line_number);
        else if (name == "ssp_scenario") config.ssp_scenario = riceair::sspScenarioFromString(token);
        else {
            riceair::Logger::getInstance().warning("readModelRunConfiguration",
                "Unrecognized parameter '" + name + "' on line " + std::to_string(line_number));
        }
    }

    config.validate();
    return config;
}

std::map<std::string, double> readOptimizerSettings(const std::string& filename) {
    const std::string calling_function_name = "readOptimizerSettings";
    std::ifstream file = openOrThrow(filename, calling_function_name);

    std::map<std::string, double> settings;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string setting_name, token;
        if (!(iss >> setting_name >> token)) {
            riceair::Logger::getInstance().error("ReadExperimentConfiguration::" + calling_function_name, "Invalid line in settings file (line " + std::to_string(line_number) + "): " + line);
            throw riceair::DataFormatException(calling_function_name, "Invalid line in settings file: " + line);
        }
        if (setting_name == "algorithm") continue;

        double value = 0.0;
        if (!parseNumber(token, value)) {
            riceair::Logger::getInstance().error("ReadExperimentConfiguration::" + calling_function_name, "Non-numeric value in settings file (line " + std::to_string(line_number) + "): " + line);
            throw riceair::DataFormatException(calling_function_name, "Non-numeric value in settings file: " + line);
        }
        std::string extra;
        if (iss >> extra) {
            riceair::Logger::getInstance().error("ReadExperimentConfiguration::" + calling_function_name, "Too many values on line in settings file (line " + std::to_string(line_number) + "): " + line);
            throw riceair::DataFormatException(calling_function_name, "Too many values on line in settings file: " + line);
        }
        settings[setting_name] = value;
    }
    riceair::Logger::getInstance().info("ReadExperimentConfiguration::" + calling_function_name, "Successfully read " + std::to_string(settings.size()) + " settings from " + filename);
    return settings;
}

std::string readAlgorithmId(const std::string& filename, const std::string& default_id) {
    std::ifstream file = openOrThrow(filename, "readAlgorithmId");

    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string name, id;
        if ((iss >> name >> id) && name == "algorithm") {
            return id;
        }
    }
    return default_id;
}

Eigen::VectorXd readTaxVector(const std::string& filename) {
    std::ifstream file = openOrThrow(filename, "readTaxVector");

    std::vector<double> values;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string token;
        bool first = true;
        while (iss >> token) {
            if (token[0] == '#') break;
            double value = 0.0;
            if (parseNumber(token, value)) {
                values.push_back(value);
            } else if (!first) {
                throw riceair::DataFormatException("readTaxVector",
                    "Invalid tax value '" + token + "' on line " + std::to_string(line_number));
            }
            first = false;
        }
    }

    if (values.empty()) {
        throw riceair::DataFormatException("readTaxVector", "No tax values found in " + filename);
    }
    return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

void saveOptimizationResults(const std::string& filename,
                             const riceair::PolicyOptimizationResult& result,
                             const std::string& timestamp) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        riceair::Logger::getInstance().error("saveOptimizationResults", "Unable to open file for writing: " + filename);
        throw riceair::FileIOException("saveOptimizationResults", "Unable to open file for writing: " + filename);
    }

    std::string ts = timestamp;
    if (ts.empty()) {
        std::time_t now = std::time(nullptr);
        std::tm tm_buf{};
        char mbstr[100];
        if (localtime_r(&now, &tm_buf) && std::strftime(mbstr, sizeof(mbstr), "%Y-%m-%d %H:%M:%S", &tm_buf)) {
            ts = mbstr;
        } else {
            ts = "TIMESTAMP_ERROR";
        }
    }

    file << "# Optimized carbon tax policy" << std::endl;
    file << "# Optimization completed: " << ts << std::endl;
    file << "# Convergence result: " << riceair::toString(result.status) << std::endl;
    file << "# Welfare: " << std::scientific << std::setprecision(10) << result.welfare << std::endl;
    file << "# Full trajectory:";
    for (Eigen::Index t = 0; t < result.taxTrajectory.size(); ++t) {
        file << " " << std::scientific << std::setprecision(8) << result.taxTrajectory(t);
    }
    file << std::endl << std::endl;

    for (Eigen::Index i = 0; i < result.optimalTax.size(); ++i) {
        file << "tax_period_" << (i + 2) << " " << std::scientific << std::setprecision(12)
             << result.optimalTax(i) << std::endl;
    }

    riceair::Logger::getInstance().info("saveOptimizationResults", "Optimized policy saved to: " + filename);
}
