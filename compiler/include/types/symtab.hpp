//! # Symbol Table
//!
//! Ordered name -> variable mapping produced by type inference and used by
//! the class builder for instance attributes. Iteration follows insertion
//! order, which is the first-seen order of the attributes.

#ifndef AUTOJIT_TYPES_SYMTAB_HPP
#define AUTOJIT_TYPES_SYMTAB_HPP

#include "types/type.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace autojit::types {

/// A typed variable. `promotable` variables may be widened by a later
/// assignment of a different numeric type; declared ones may not.
struct Variable {
    TypePtr type;
    bool promotable = true;
};

class SymbolTable {
public:
    SymbolTable() = default;

    /// Inserts or replaces. A replaced entry keeps its position.
    void define(const std::string& name, Variable var) {
        auto it = index_.find(name);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(var);
            return;
        }
        index_.emplace(name, entries_.size());
        entries_.emplace_back(name, std::move(var));
    }

    [[nodiscard]] auto lookup(const std::string& name) const -> std::optional<Variable> {
        auto it = index_.find(name);
        if (it == index_.end())
            return std::nullopt;
        return entries_[it->second].second;
    }

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return index_.count(name) > 0;
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

    [[nodiscard]] auto entries() const -> const std::vector<std::pair<std::string, Variable>>& {
        return entries_;
    }

private:
    std::vector<std::pair<std::string, Variable>> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace autojit::types

#endif // AUTOJIT_TYPES_SYMTAB_HPP
