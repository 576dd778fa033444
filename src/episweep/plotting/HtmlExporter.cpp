#include "episweep/plotting/HtmlExporter.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <sstream>

namespace episweep {

    const char* const HtmlExporter::PLOTLY_CDN_URL = "https://cdn.plot.ly/plotly-2.27.0.min.js";
    const char* const HtmlExporter::PLOTLY_FROM_CDN = "cdn";

    std::string HtmlExporter::plotlyScriptTag(const std::string& plotly_js) {
        if (plotly_js == PLOTLY_FROM_CDN) {
            Logger::getInstance().warning("HtmlExporter::plotlyScriptTag",
                                          "Page will load plotly.js from " + std::string(PLOTLY_CDN_URL) + ".");
            return "<script src=\"" + std::string(PLOTLY_CDN_URL) + "\"></script>";
        }

        std::ifstream bundle(plotly_js, std::ios::in | std::ios::binary);
        if (!bundle.is_open()) {
            throw FileIOException("HtmlExporter::plotlyScriptTag",
                                  "Could not open plotly.js bundle '" + plotly_js +
                                  "'. Point plotly_js at an installed plotly.min.js, or set it to '" +
                                  PLOTLY_FROM_CDN + "'.");
        }
        std::ostringstream code;
        code << bundle.rdbuf();
        if (bundle.bad() || code.str().empty()) {
            throw FileIOException("HtmlExporter::plotlyScriptTag", "plotly.js bundle '" + plotly_js + "' is empty or unreadable.");
        }
        Logger::getInstance().debug("HtmlExporter::plotlyScriptTag",
                                    "Inlining " + std::to_string(code.str().size()) + " bytes of plotly.js from " + plotly_js);
        return "<script type=\"text/javascript\">" + code.str() + "</script>";
    }

    nlohmann::json HtmlExporter::toPlotlyJson(const Figure& figure) {
        const std::vector<bool> initial = figure.initialVisibility();

        nlohmann::json data = nlohmann::json::array();
        for (size_t i = 0; i < figure.traces.size(); ++i) {
            const Trace& trace = figure.traces[i];
            data.push_back({
                {"type", "scatter"},
                {"mode", "lines"},
                {"name", trace.name},
                {"legendgroup", trace.compartment},
                {"x", figure.time_axis},
                {"y", trace.y},
                {"visible", static_cast<bool>(initial[i])},
                {"line", {{"color", trace.color}}}
            });
        }

        nlohmann::json steps = nlohmann::json::array();
        for (size_t s = 0; s < figure.steps.size(); ++s) {
            const SliderStep& step = figure.steps[s];
            steps.push_back({
                {"method", "update"},
                {"label", step.label},
                {"args", nlohmann::json::array({
                    {{"visible", figure.visibilityForStep(static_cast<int>(s))}},
                    {{"title", {{"text", step.title}}}}
                })}
            });
        }

        nlohmann::json layout = {
            {"title", {{"text", figure.activeTitle()}}},
            {"xaxis", {{"title", {{"text", figure.x_axis_title}}}}},
            {"yaxis", {{"title", {{"text", figure.y_axis_title}}}}},
            {"sliders", nlohmann::json::array({
                {
                    {"active", figure.active_step},
                    {"currentvalue", {{"prefix", figure.slider_prefix}}},
                    {"pad", {{"t", 50}}},
                    {"steps", steps}
                }
            })}
        };

        return {{"data", data}, {"layout", layout}};
    }

    std::string HtmlExporter::renderHtml(const Figure& figure, const std::string& script_tag) {
        const nlohmann::json plotly = toPlotlyJson(figure);
        std::ostringstream html;
        html << "<!DOCTYPE html>\n"
             << "<html>\n"
             << "<head>\n"
             << "<meta charset=\"utf-8\" />\n"
             << "<title>" << figure.activeTitle() << "</title>\n"
             << script_tag << "\n"
             << "</head>\n"
             << "<body>\n"
             << "<div id=\"episweep-figure\" style=\"width:100%;height:90vh;\"></div>\n"
             << "<script type=\"text/javascript\">\n"
             << "var figure = " << plotly.dump() << ";\n"
             << "Plotly.newPlot(\"episweep-figure\", figure.data, figure.layout, {responsive: true});\n"
             << "</script>\n"
             << "</body>\n"
             << "</html>\n";
        return html.str();
    }

    void HtmlExporter::writeHtml(const Figure& figure, const std::string& path, const std::string& script_tag) {
        if (!FileUtils::ensureParentDirectoryExists(path)) {
            throw FileIOException("HtmlExporter::writeHtml", "Could not create the directory for: " + path);
        }
        const std::string html = renderHtml(figure, script_tag);

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw FileIOException("HtmlExporter::writeHtml", "Could not open file for writing: " + path);
        }
        file << html;
        file.close();
        if (file.fail()) {
            throw FileIOException("HtmlExporter::writeHtml", "Failed while writing: " + path);
        }
        Logger::getInstance().info("HtmlExporter::writeHtml", "Figure written to " + path + " (" +
                                   std::to_string(html.size()) + " bytes).");
    }

} // namespace episweep
