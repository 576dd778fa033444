#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <sstream>
#include <stdexcept>
#include <string>

namespace episweep {

/**
 * @brief Root of every error raised by the sweep library.
 *
 * what() reads "[function] Category: message", or "[file:line (function)] Category: message"
 * when thrown through one of the THROW_* macros.
 */
class ModelException : public std::runtime_error {
public:
    ModelException(const std::string& functionName, const std::string& message)
        : ModelException("ModelException", nullptr, 0, functionName, message) {}

    const std::string& getFunctionName() const noexcept { return functionName_; }
    const std::string& getCategory() const noexcept { return category_; }
    /** @return Source file of the throw site, or an empty string when unknown. */
    const char* getFile() const noexcept { return file_ ? file_ : ""; }
    int getLine() const noexcept { return line_; }

protected:
    ModelException(const std::string& category, const char* file, int line,
                   const std::string& functionName, const std::string& message)
        : std::runtime_error(compose(category, file, line, functionName, message)),
          functionName_(functionName), category_(category), file_(file), line_(line) {}

private:
    static std::string compose(const std::string& category, const char* file, int line,
                               const std::string& functionName, const std::string& message) {
        std::ostringstream oss;
        oss << "[";
        if (file) oss << file << ":" << line << " (" << functionName << ")";
        else oss << functionName;
        oss << "] " << category << ": " << message;
        return oss.str();
    }

    std::string functionName_;
    std::string category_;
    const char* file_;
    int line_;
};

/** @brief Bad argument: size mismatch, negative value, unordered grid, unknown name. */
class InvalidParameterException : public ModelException {
public:
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : ModelException("Invalid Parameter", nullptr, 0, functionName, message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException("Invalid Parameter", file, line, functionName, message) {}
};

/** @brief Integration failed or produced a non-finite state. Aborts the sweep. */
class SimulationException : public ModelException {
public:
    SimulationException(const std::string& functionName, const std::string& message)
        : ModelException("Simulation Error", nullptr, 0, functionName, message) {}
    SimulationException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException("Simulation Error", file, line, functionName, message) {}
};

/** @brief Model parameters rejected by a model's create(). */
class ModelConstructionException : public ModelException {
public:
    ModelConstructionException(const std::string& functionName, const std::string& message)
        : ModelException("Model Construction Error", nullptr, 0, functionName, message) {}
};

/** @brief Traces and slider steps of a figure do not line up. */
class FigureConstructionException : public ModelException {
public:
    FigureConstructionException(const std::string& functionName, const std::string& message)
        : ModelException("Figure Construction Error", nullptr, 0, functionName, message) {}
};

class FileIOException : public ModelException {
public:
    FileIOException(const std::string& functionName, const std::string& message)
        : ModelException("File IO Error", nullptr, 0, functionName, message) {}
};

/** @brief Malformed configuration line or value. */
class DataFormatException : public ModelException {
public:
    DataFormatException(const std::string& functionName, const std::string& message)
        : ModelException("Data Format Error", nullptr, 0, functionName, message) {}
};

/** @brief Incomplete or inconsistent simulation output. */
class InvalidResultException : public ModelException {
public:
    InvalidResultException(const std::string& functionName, const std::string& message)
        : ModelException("Invalid Result", nullptr, 0, functionName, message) {}
};

/** @brief Beta, compartment or slider index outside its range. */
class OutOfRangeException : public ModelException {
public:
    OutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : ModelException("Out Of Range", file, line, functionName, message) {}
};

} // namespace episweep

#define THROW_INVALID_PARAM(func, msg) throw episweep::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_SIMULATION_ERROR(func, msg) throw episweep::SimulationException(__FILE__, __LINE__, func, msg)
#define THROW_OUT_OF_RANGE(func, msg) throw episweep::OutOfRangeException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
