// Def-Use Chains Implementation

#include "ir/analysis/def_use.hpp"

namespace sift::ir {

auto DefUseChains::build(const Function& func) -> DefUseChains {
    DefUseChains chains;

    for (const auto& param : func.params) {
        chains.defs_[param.value_id] = DefSite{};
    }

    for (const auto& block : func.blocks) {
        for (size_t i = 0; i < block.instructions.size(); ++i) {
            const auto& inst = block.instructions[i];
            if (inst.has_result()) {
                chains.defs_[inst.result] = DefSite{block.id, i};
            }
            for_each_operand(inst, [&](const Value& v) {
                chains.uses_[v.id].push_back(UsePosition{block.id, i});
            });
        }

        if (block.terminator) {
            size_t term_index = block.instructions.size();
            for_each_operand(*block.terminator, [&](const Value& v) {
                chains.uses_[v.id].push_back(UsePosition{block.id, term_index});
            });
        }
    }

    return chains;
}

auto DefUseChains::uses(ValueId value) const -> const std::vector<UsePosition>& {
    static const std::vector<UsePosition> empty;
    auto it = uses_.find(value);
    return it != uses_.end() ? it->second : empty;
}

auto DefUseChains::definition(ValueId value) const -> std::optional<DefSite> {
    auto it = defs_.find(value);
    if (it == defs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace sift::ir
