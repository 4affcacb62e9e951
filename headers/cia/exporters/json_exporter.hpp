#ifndef CIA_JSON_EXPORTER_HPP
#define CIA_JSON_EXPORTER_HPP

#include "cia/exporters/exporter.hpp"

#include <nlohmann/json.hpp>

namespace cia::exporters {

    /**
     * JSON rendering with snake_case keys. Empty old/new values and missing
     * suggestions are omitted from breaking changes.
     */
    class JsonExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::JSON; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".json"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "JSON"; }

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analysis::BreakingChangeReport& report,
            const ExportOptions& options
        ) const override;

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analysis::FileImpact& impact,
            const ExportOptions& options
        ) const override;
    };

    [[nodiscard]] nlohmann::json to_json(const Symbol& symbol);
    [[nodiscard]] nlohmann::json to_json(const Reference& reference);
    [[nodiscard]] nlohmann::json to_json(const analysis::BreakingChange& change);
    [[nodiscard]] nlohmann::json to_json(const analysis::BreakingChangeReport& report);
    [[nodiscard]] nlohmann::json to_json(const analysis::Impact& impact);
    [[nodiscard]] nlohmann::json to_json(const analysis::FileImpact& impact);

}  // namespace cia::exporters

#endif //CIA_JSON_EXPORTER_HPP
