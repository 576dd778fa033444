#ifndef HTML_EXPORTER_HPP
#define HTML_EXPORTER_HPP

#include "episweep/plotting/Figure.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace episweep {

    /**
     * @class HtmlExporter
     * @brief Serializes a Figure as a Plotly figure and writes it into a single self-contained HTML page.
     */
    class HtmlExporter {
    public:
        HtmlExporter() = delete;

        /** @brief plotly.js bundle referenced when the page is allowed to load it from the network. */
        static const char* const PLOTLY_CDN_URL;

        /** @brief plotly_js setting value that selects PLOTLY_CDN_URL instead of an inlined bundle. */
        static const char* const PLOTLY_FROM_CDN;

        /**
         * @brief The <script> element that provides plotly.js to the page.
         *
         * @param plotly_js Path of an installed plotly.js bundle, whose contents are inlined so the
         *        page works offline, or PLOTLY_FROM_CDN for a remote <script src>.
         * @throws FileIOException If the bundle cannot be read or is empty.
         */
        static std::string plotlyScriptTag(const std::string& plotly_js);

        /**
         * @brief Plotly figure object: {"data": [...], "layout": {...}}.
         *
         * Every trace is a line scatter with its initial visibility; the layout carries a single
         * slider whose steps use the "update" method to set trace visibility and the title.
         */
        static nlohmann::json toPlotlyJson(const Figure& figure);

        /**
         * @brief Full HTML document that renders the figure.
         * @param script_tag plotly.js element, as returned by plotlyScriptTag().
         */
        static std::string renderHtml(const Figure& figure, const std::string& script_tag);

        /**
         * @brief Writes renderHtml(figure, script_tag) to `path`, replacing any existing file.
         * @throws FileIOException If the file cannot be opened or written.
         */
        static void writeHtml(const Figure& figure, const std::string& path, const std::string& script_tag);
    };

} // namespace episweep

#endif // HTML_EXPORTER_HPP
