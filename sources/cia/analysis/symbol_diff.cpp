#include "cia/analysis/symbol_diff.hpp"

namespace cia::analysis {

    SymbolMap::SymbolMap(const std::vector<Symbol>& symbols) {
        entries_.reserve(symbols.size());
        for (const auto& symbol : symbols) {
            auto key = SymbolKey::of(symbol);
            if (const auto it = index_.find(key); it != index_.end()) {
                entries_[it->second] = symbol;
                continue;
            }
            index_.emplace(std::move(key), entries_.size());
            entries_.push_back(symbol);
        }
    }

    const Symbol* SymbolMap::find(const SymbolKey& key) const {
        const auto it = index_.find(key);
        if (it == index_.end()) {
            return nullptr;
        }
        return &entries_[it->second];
    }

    bool symbol_changed(const Symbol& before, const Symbol& after) {
        return before.signature != after.signature
            || before.parameters != after.parameters
            || before.return_type != after.return_type
            || before.exported != after.exported;
    }

    std::vector<SymbolChange> diff_symbols(const SymbolMap& before, const SymbolMap& after) {
        std::vector<SymbolChange> changes;

        for (const auto& old_symbol : before.symbols()) {
            if (!after.contains(SymbolKey::of(old_symbol))) {
                changes.push_back({ChangeKind::Removed, old_symbol, std::nullopt});
            }
        }

        for (const auto& new_symbol : after.symbols()) {
            const Symbol* old_symbol = before.find(SymbolKey::of(new_symbol));
            if (old_symbol == nullptr) {
                changes.push_back({ChangeKind::Added, std::nullopt, new_symbol});
            } else if (symbol_changed(*old_symbol, new_symbol)) {
                changes.push_back({ChangeKind::Modified, *old_symbol, new_symbol});
            }
        }

        return changes;
    }

}  // namespace cia::analysis
