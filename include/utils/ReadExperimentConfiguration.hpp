#ifndef READEXPERIMENTCONFIGURATION_HPP
#define READEXPERIMENTCONFIGURATION_HPP

#include <map>
#include <string>
#include <Eigen/Dense>
#include "rice_air/ModelRunConfiguration.hpp"
#include "rice_air/PolicyOptimizer.hpp"

/**
 * @brief Reads the experiment configuration handed to the model builder.
 *
 * Each non-empty line in the file should contain:
 * <name> <value>
 * Lines starting with '#' are ignored. Recognized names are nsteps, rho, eta,
 * tau, kuznets_term, ssp_scenario (SSP1..SSP5), hyears, use_VSL (0/1 or
 * true/false) and VOLY_elasticity. Unknown names are logged and skipped;
 * missing names keep their defaults.
 *
 * @param filename Path to the configuration file.
 * @return riceair::ModelRunConfiguration The validated configuration.
 *
 * @throws riceair::FileIOException if the file cannot be opened.
 * @throws riceair::DataFormatException if a value cannot be parsed.
 * @throws riceair::InvalidParameterException if the resulting configuration is invalid.
 */
riceair::ModelRunConfiguration readModelRunConfiguration(const std::string &filename);

/**
 * @brief Reads optimizer settings from a text file.
 *
 * Each non-empty line in the file should contain:
 * <setting_name> <value>
 * Lines starting with '#' are ignored. The "algorithm" line is skipped here;
 * it is read by readAlgorithmId.
 *
 * @param filename Path to the settings file.
 * @return std::map<std::string, double> Map of setting names to values.
 *
 * @throws riceair::FileIOException if the file cannot be opened.
 * @throws riceair::DataFormatException if a line is formatted incorrectly.
 */
std::map<std::string, double> readOptimizerSettings(const std::string &filename);

/**
 * @brief Reads the "algorithm <id>" line of an optimizer settings file.
 *
 * @param filename Path to the settings file.
 * @param default_id Returned when the file has no algorithm line.
 * @return std::string The algorithm identifier.
 *
 * @throws riceair::FileIOException if the file cannot be opened.
 */
std::string readAlgorithmId(const std::string &filename, const std::string &default_id = "hill_climbing");

/**
 * @brief Reads a tax vector (initial guess) from a text file.
 *
 * All numbers on non-comment lines are collected in order. A line may start
 * with a label (e.g. "tax_period_2 150000"), which is ignored.
 *
 * @param filename Path to the tax vector file.
 * @return Eigen::VectorXd The tax values.
 *
 * @throws riceair::FileIOException if the file cannot be opened.
 * @throws riceair::DataFormatException if a token after the label is not a number or no value is found.
 */
Eigen::VectorXd readTaxVector(const std::string &filename);

/**
 * @brief Saves an optimized policy to a file.
 *
 * Writes the optimized tax vector in a format readable by readTaxVector, with
 * the welfare, the convergence status and the full trajectory as comments.
 *
 * @param filename Path to save the policy.
 * @param result Result of PolicyOptimizer::optimize.
 * @param timestamp Optional timestamp; the current local time when empty.
 *
 * @throws riceair::FileIOException if the file cannot be opened.
 */
void saveOptimizationResults(const std::string &filename,
                             const riceair::PolicyOptimizationResult &result,
                             const std::string &timestamp = "");

#endif // READEXPERIMENTCONFIGURATION_HPP
