#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace riceair {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the policy optimization pipeline.
 */
class ModelException : public std::runtime_error {
public:
    /**
     * @brief Construct a ModelException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    ModelException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    ModelException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for invalid method parameters.
 */
class InvalidParameterException : public ModelException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "InvalidParameter", message) {}

protected:
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : ModelException(file, line, functionName, category, message) {}
};

/**
 * @brief A tax vector is malformed (too long, non-finite, wrong length for the window).
 */
class InvalidTaxVectorException : public InvalidParameterException {
public:
    InvalidTaxVectorException(const char* file, int line, const std::string& functionName, const std::string& message)
        : InvalidParameterException(file, line, functionName, "Bad tax vector", message) {}
};

/**
 * @brief The backstop price table is unusable (empty, non-positive or non-finite entries, shape mismatch).
 */
class InvalidBackstopTableException : public InvalidParameterException {
public:
    InvalidBackstopTableException(const char* file, int line, const std::string& functionName, const std::string& message)
        : InvalidParameterException(file, line, functionName, "Bad backstop table", message) {}
};

/**
 * @brief A starting point or decision variable lies outside its box constraints.
 */
class InvalidBoundsException : public InvalidParameterException {
public:
    InvalidBoundsException(const char* file, int line, const std::string& functionName, const std::string& message)
        : InvalidParameterException(file, line, functionName, "Bad bounds", message) {}
};

/**
 * @brief Exception for failures of the external model run.
 */
class SimulationException : public ModelException {
public:
    /**
     * @brief Construct a SimulationException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the simulation error.
     */
    SimulationException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Simulation Error: " + message) {}
    SimulationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Simulation Error", message) {}
};

/**
 * @brief A model run finished but produced non-finite welfare or emissions.
 */
class EvaluationException : public ModelException {
public:
    EvaluationException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Evaluation Error: " + message) {}
    EvaluationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "Evaluation Error", message) {}
};

/**
 * @brief Exception for model construction errors.
 */
class ModelConstructionException : public ModelException {
public:
    /**
     * @brief Construct a ModelConstructionException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the construction error.
     */
    ModelConstructionException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Model Construction Error: " + message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public ModelException {
public:
    /**
     * @brief Construct a FileIOException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the file I/O error.
     */
    FileIOException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public ModelException {
public:
    /**
     * @brief Construct a DataFormatException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the formatting error.
     */
    DataFormatException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Data Format Error: " + message) {}
};

/**
 * @brief Exception for model outputs with an unexpected shape.
 */
class InvalidResultException : public ModelException {
public:
    /**
     * @brief Construct an InvalidResultException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the invalid result.
     */
    InvalidResultException(const std::string& functionName, const std::string& message)
        : ModelException(functionName, "Invalid Result: " + message) {}
};

/**
 * @brief Exception for out-of-range access.
 */
class OutOfRangeException : public ModelException {
public:
    /**
     * @brief Construct an OutOfRangeException.
     * @param file File where the error occurred.
     * @param line Line number where the error occurred.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the out-of-range access.
     */
    OutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException(file, line, functionName, "OutOfRange", message) {}
};

} // namespace riceair

#define THROW_INVALID_PARAM(func, msg) throw riceair::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_INVALID_TAX_VECTOR(func, msg) throw riceair::InvalidTaxVectorException(__FILE__, __LINE__, func, msg)
#define THROW_INVALID_BACKSTOP(func, msg) throw riceair::InvalidBackstopTableException(__FILE__, __LINE__, func, msg)
#define THROW_INVALID_BOUNDS(func, msg) throw riceair::InvalidBoundsException(__FILE__, __LINE__, func, msg)
#define THROW_EVALUATION_ERROR(func, msg) throw riceair::EvaluationException(__FILE__, __LINE__, func, msg)
#define THROW_SIMULATION_ERROR(func, msg) throw riceair::SimulationException(__FILE__, __LINE__, func, msg)
#define THROW_OUT_OF_RANGE(func, msg) throw riceair::OutOfRangeException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
