#ifndef SWEEP_CONFIGURATION_HPP
#define SWEEP_CONFIGURATION_HPP

#include <map>
#include <string>
#include "episweep/parameters/SweepSettings.hpp"

/**
 * @brief Reads a key-value settings file.
 *
 * Each non-empty line in the file should contain:
 * <setting_name> <value>
 * Lines starting with '#' are ignored, as is anything after a '#' on a line.
 *
 * @param filename Path to the settings file.
 * @return std::map<std::string, std::string> Map of setting names to their (unparsed) values.
 *
 * @throws episweep::FileIOException if the file cannot be opened.
 * @throws episweep::DataFormatException if a line does not hold exactly one name and one value,
 *         or a name appears twice.
 */
std::map<std::string, std::string> readSettingsFile(const std::string &filename);

/**
 * @brief Reads a sweep configuration file on top of a set of defaults.
 *
 * Numeric keys: N, gamma, sigma, alpha, initial_infected, beta_start, beta_stop, beta_step,
 * default_beta, t_start, t_end, num_tsteps, dt_hint, abs_error, rel_error.
 * String keys: solver (dopri5 | rkf45), output_html, plotly_js (bundle path | cdn), log_level,
 * log_file.
 * Unknown keys are reported as warnings and ignored.
 *
 * @param filename Path to the configuration file.
 * @param defaults Settings used for every key the file does not mention.
 * @return episweep::SweepSettings The merged, validated settings.
 *
 * @throws episweep::FileIOException if the file cannot be opened.
 * @throws episweep::DataFormatException if a value cannot be parsed.
 * @throws episweep::InvalidParameterException if the merged settings are inconsistent.
 */
episweep::SweepSettings readSweepConfiguration(const std::string &filename,
                                               const episweep::SweepSettings &defaults);

#endif // SWEEP_CONFIGURATION_HPP
