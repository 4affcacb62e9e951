#ifndef CIA_SYMBOL_DIFF_HPP
#define CIA_SYMBOL_DIFF_HPP

/**
 * @file symbol_diff.hpp
 * @brief Structural diff of two symbol lists extracted from one file.
 *
 * Both the breaking-change detector and the impact analyzer match symbols
 * across revisions by SymbolKey. When a list holds several symbols with
 * the same key the last one wins, but the key keeps the position of its
 * first occurrence so iteration follows source order.
 */

#include "cia/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace cia::analysis {

    /**
     * How a symbol differs between the old and new revision.
     */
    enum class ChangeKind {
        Added,
        Removed,
        Modified
    };

    inline const char* to_string(const ChangeKind kind) noexcept {
        switch (kind) {
            case ChangeKind::Added:    return "added";
            case ChangeKind::Removed:  return "removed";
            case ChangeKind::Modified: return "modified";
        }
        return "unknown";
    }

    /**
     * Key -> symbol map of one revision.
     */
    class SymbolMap {
    public:
        SymbolMap() = default;
        explicit SymbolMap(const std::vector<Symbol>& symbols);

        [[nodiscard]] const Symbol* find(const SymbolKey& key) const;

        [[nodiscard]] bool contains(const SymbolKey& key) const {
            return find(key) != nullptr;
        }

        /**
         * One symbol per key, in order of first appearance.
         */
        [[nodiscard]] const std::vector<Symbol>& symbols() const noexcept {
            return entries_;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return entries_.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return entries_.empty();
        }

    private:
        std::vector<Symbol> entries_;
        std::map<SymbolKey, std::size_t> index_;
    };

    /**
     * One changed symbol. Removed changes carry only @c before, added
     * changes only @c after, modified changes both.
     */
    struct SymbolChange {
        ChangeKind kind = ChangeKind::Modified;
        std::optional<Symbol> before;
        std::optional<Symbol> after;

        /**
         * The symbol an impact is reported against: the old declaration for
         * removals, the new one otherwise.
         */
        [[nodiscard]] const Symbol& symbol() const {
            return after.has_value() ? *after : *before;
        }
    };

    /**
     * True when signature, parameter list, return type or export flag differ.
     */
    [[nodiscard]] bool symbol_changed(const Symbol& before, const Symbol& after);

    /**
     * Lists removed symbols in old source order, then modified and added
     * symbols in new source order. Unchanged symbols are omitted.
     */
    [[nodiscard]] std::vector<SymbolChange> diff_symbols(
        const SymbolMap& before,
        const SymbolMap& after
    );

}  // namespace cia::analysis

#endif //CIA_SYMBOL_DIFF_HPP
