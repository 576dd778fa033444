#include <fstream>
#include <sstream>
#include <string>
#include <map>
#include "utils/SweepConfiguration.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

static double parseDouble(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw episweep::DataFormatException("readSweepConfiguration", "Invalid numeric value '" + value + "' for setting '" + key + "'.");
    }
    if (consumed != value.size()) {
        throw episweep::DataFormatException("readSweepConfiguration", "Invalid numeric value '" + value + "' for setting '" + key + "'.");
    }
    return parsed;
}

static int parseInt(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw episweep::DataFormatException("readSweepConfiguration", "Invalid integer value '" + value + "' for setting '" + key + "'.");
    }
    if (consumed != value.size()) {
        throw episweep::DataFormatException("readSweepConfiguration", "Invalid integer value '" + value + "' for setting '" + key + "'.");
    }
    return parsed;
}

std::map<std::string, std::string> readSettingsFile(const std::string &filename) {
    std::map<std::string, std::string> settings;
    std::ifstream file(filename);
    if (!file.is_open()) {
        episweep::Logger::getInstance().error("SweepConfiguration::readSettingsFile", "Error opening settings file: " + filename);
        throw episweep::FileIOException("readSettingsFile", "Error opening settings file: " + filename);
    }
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        size_t comment = line.find('#');
        if (comment != std::string::npos) line.erase(comment);
        line.erase(0, line.find_first_not_of(" \t\n\r\f\v"));
        line.erase(line.find_last_not_of(" \t\n\r\f\v") + 1);
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key >> value)) {
            throw episweep::DataFormatException("readSettingsFile", "Missing value on line " + std::to_string(line_number) + ": " + line);
        }
        std::string extra;
        if (iss >> extra) {
            throw episweep::DataFormatException("readSettingsFile", "Too many values on line " + std::to_string(line_number) + ": " + line);
        }
        if (!settings.emplace(key, value).second) {
            throw episweep::DataFormatException("readSettingsFile", "Setting '" + key + "' given twice (line " + std::to_string(line_number) + ").");
        }
    }
    file.close();
    return settings;
}

episweep::SweepSettings readSweepConfiguration(const std::string &filename,
                                               const episweep::SweepSettings &defaults) {
    episweep::SweepSettings settings = defaults;
    const std::map<std::string, std::string> values = readSettingsFile(filename);

    for (const auto& [key, value] : values) {
        if      (key == "N") settings.N = parseDouble(key, value);
        else if (key == "gamma") settings.gamma = parseDouble(key, value);
        else if (key == "sigma") settings.sigma = parseDouble(key, value);
        else if (key == "alpha") settings.alpha = parseDouble(key, value);
        else if (key == "initial_infected") settings.initial_infected = parseDouble(key, value);
        else if (key == "beta_start") settings.beta_grid.start = parseDouble(key, value);
        else if (key == "beta_stop") settings.beta_grid.stop = parseDouble(key, value);
        else if (key == "beta_step") settings.beta_grid.step = parseDouble(key, value);
        else if (key == "default_beta") settings.default_beta = parseDouble(key, value);
        else if (key == "t_start") settings.start_time = parseDouble(key, value);
        else if (key == "t_end") settings.end_time = parseDouble(key, value);
        else if (key == "num_tsteps") settings.num_tsteps = parseInt(key, value);
        else if (key == "dt_hint") settings.dt_hint = parseDouble(key, value);
        else if (key == "abs_error") settings.abs_error = parseDouble(key, value);
        else if (key == "rel_error") settings.rel_error = parseDouble(key, value);
        else if (key == "solver") settings.solver = value;
        else if (key == "output_html") settings.output_html = value;
        else if (key == "plotly_js") settings.plotly_js = value;
        else if (key == "log_file") settings.log_file = value;
        else if (key == "log_level") {
            episweep::LogLevel level;
            if (!episweep::parseLogLevel(value, level)) {
                throw episweep::DataFormatException("readSweepConfiguration", "Unknown log level '" + value + "'.");
            }
            settings.log_level = value;
        }
        else {
            episweep::Logger::getInstance().warning("readSweepConfiguration", "Unrecognized setting '" + key + "' in " + filename + ". Ignoring.");
        }
    }

    episweep::validateSweepSettings(settings);
    episweep::Logger::getInstance().info("readSweepConfiguration", "Loaded " + std::to_string(values.size()) + " settings from " + filename);
    return settings;
}
