#include <string>

#include "episweep/SweepPipeline.hpp"
#include "episweep/parameters/SweepSettings.hpp"
#include "episweep/plotting/HtmlExporter.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/SweepConfiguration.hpp"

using namespace episweep;

int main(int argc, char* argv[]) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().info("main", "Starting SEIR beta sweep...");

    try {
        SweepSettings settings = defaultSEIRSettings();

        std::string config_path;
        if (argc > 1) {
            config_path = argv[1];
        } else {
            const std::string candidate = FileUtils::joinPaths(FileUtils::getProjectRoot(), "data/config/seir_sweep.txt");
            if (FileUtils::fileExists(candidate)) {
                config_path = candidate;
            }
        }

        if (!config_path.empty()) {
            Logger::getInstance().info("main", "Reading configuration from: " + config_path);
            settings = readSweepConfiguration(config_path, settings);
        } else {
            Logger::getInstance().info("main", "No configuration file found, using built-in defaults.");
        }

        LogLevel level;
        if (parseLogLevel(settings.log_level, level)) {
            Logger::getInstance().setLogLevel(level);
        } else {
            Logger::getInstance().warning("main", "Unknown log_level '" + settings.log_level + "', keeping INFO.");
        }
        if (!settings.log_file.empty() &&
            !(FileUtils::ensureParentDirectoryExists(settings.log_file) &&
              Logger::getInstance().enableFileLogging(true, settings.log_file))) {
            Logger::getInstance().warning("main", "Continuing with console logging only.");
        }

        // A relative plotly.js bundle is looked up in the working directory, then under the project root.
        if (settings.plotly_js != HtmlExporter::PLOTLY_FROM_CDN && !FileUtils::fileExists(settings.plotly_js)) {
            const std::string bundled = FileUtils::joinPaths(FileUtils::getProjectRoot(), settings.plotly_js);
            if (FileUtils::fileExists(bundled)) {
                settings.plotly_js = bundled;
            }
        }

        PipelineOutput output = SweepPipeline::runSEIR(settings);
        Logger::getInstance().info("main", "Done. Open " + output.output_path + " in a browser to explore the sweep.");

    } catch (const ModelException& e) {
        Logger::getInstance().error("main", std::string("Sweep failed: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::getInstance().fatal("main", std::string("Unexpected error: ") + e.what());
        return 1;
    }

    return 0;
}
