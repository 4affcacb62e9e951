#ifndef CIA_BREAKING_CHANGE_HPP
#define CIA_BREAKING_CHANGE_HPP

/**
 * @file breaking_change.hpp
 * @brief Detection of API-incompatible edits between two revisions of a file.
 *
 * Rules, applied to symbols matched by SymbolKey:
 * - an exported symbol that disappears is a removal (critical), or a
 *   visibility change (critical) when a same-kind symbol whose name differs
 *   only in case appears in the new revision
 * - exported -> unexported is a visibility change (critical) and ends the
 *   checks for that symbol
 * - more parameters is required_parameter (error), fewer is
 *   parameter_change (warning), each differing position is
 *   parameter_change (error)
 * - a changed non-empty return type is return_type_change (error)
 * - any other signature edit is signature_change (warning)
 *
 * Unexported removals and additions are never reported.
 */

#include "cia/result.hpp"
#include "cia/error.hpp"
#include "cia/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cia::analysis {

    enum class BreakingChangeType {
        Removal,
        SignatureChange,
        TypeChange,
        VisibilityChange,
        ParameterChange,
        ReturnTypeChange,
        RequiredParameter,
        BehaviorChange
    };

    inline const char* to_string(const BreakingChangeType type) noexcept {
        switch (type) {
            case BreakingChangeType::Removal:           return "removal";
            case BreakingChangeType::SignatureChange:   return "signature_change";
            case BreakingChangeType::TypeChange:        return "type_change";
            case BreakingChangeType::VisibilityChange:  return "visibility_change";
            case BreakingChangeType::ParameterChange:   return "parameter_change";
            case BreakingChangeType::ReturnTypeChange:  return "return_type_change";
            case BreakingChangeType::RequiredParameter: return "required_parameter";
            case BreakingChangeType::BehaviorChange:    return "behavior_change";
        }
        return "unknown";
    }

    /**
     * Breaking-change scale: warning < error < critical.
     */
    enum class ChangeSeverity {
        Warning,
        Error,
        Critical
    };

    inline const char* to_string(const ChangeSeverity severity) noexcept {
        switch (severity) {
            case ChangeSeverity::Warning:  return "warning";
            case ChangeSeverity::Error:    return "error";
            case ChangeSeverity::Critical: return "critical";
        }
        return "unknown";
    }

    struct BreakingChange {
        BreakingChangeType type = BreakingChangeType::SignatureChange;
        Symbol symbol;
        std::string old_value;
        std::string new_value;
        std::string file_path;
        std::size_t line = 0;
        ChangeSeverity severity = ChangeSeverity::Warning;
        std::string description;
        std::optional<std::string> suggestion;

        /**
         * Critical and error changes break callers; warnings do not.
         */
        [[nodiscard]] bool is_breaking() const noexcept {
            return severity != ChangeSeverity::Warning;
        }
    };

    struct BreakingChangeReport {
        std::string file_name;
        std::size_t total_changes = 0;
        std::size_t critical_count = 0;
        std::size_t error_count = 0;
        std::size_t warning_count = 0;
        std::vector<BreakingChange> changes;
        std::string summary;
        bool has_breaking = false;
    };

    class BreakingChangeDetector {
    public:
        /**
         * Compares two revisions of @p file_path.
         *
         * An old revision that does not parse is treated as a new file. A new
         * revision that does not parse is a ParseError.
         */
        [[nodiscard]] Result<BreakingChangeReport, Error> detect(
            std::string_view old_content,
            std::string_view new_content,
            const std::string& file_path
        ) const;

        /**
         * Compares two already extracted symbol lists.
         */
        [[nodiscard]] BreakingChangeReport compare(
            const std::vector<Symbol>& old_symbols,
            const std::vector<Symbol>& new_symbols,
            const std::string& file_path
        ) const;
    };

    [[nodiscard]] inline bool is_breaking(const BreakingChangeReport& report) noexcept {
        return report.has_breaking;
    }

    /**
     * Critical and error changes of @p report, in report order.
     */
    [[nodiscard]] std::vector<BreakingChange> get_breaking_changes(const BreakingChangeReport& report);

}  // namespace cia::analysis

#endif //CIA_BREAKING_CHANGE_HPP
