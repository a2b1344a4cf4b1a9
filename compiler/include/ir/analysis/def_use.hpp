#pragma once

// Def-Use Chains
//
// Maps every SSA value to its definition site and to the ordered list of
// positions that read it. A position whose index equals the block's
// instruction count denotes the block terminator.

#include "ir/ir.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace sift::ir {

struct UsePosition {
    BlockId block;
    size_t index; // == instructions.size() for the terminator

    auto operator==(const UsePosition& other) const -> bool = default;
};

struct DefSite {
    BlockId block = INVALID_BLOCK; // INVALID_BLOCK for parameters
    size_t index = 0;

    [[nodiscard]] auto is_param() const -> bool {
        return block == INVALID_BLOCK;
    }
};

class DefUseChains {
public:
    // Walks blocks in layout order, instructions in order, terminator last
    static auto build(const Function& func) -> DefUseChains;

    [[nodiscard]] auto uses(ValueId value) const -> const std::vector<UsePosition>&;
    [[nodiscard]] auto use_count(ValueId value) const -> size_t {
        return uses(value).size();
    }
    [[nodiscard]] auto has_uses(ValueId value) const -> bool {
        return !uses(value).empty();
    }

    [[nodiscard]] auto definition(ValueId value) const -> std::optional<DefSite>;
    [[nodiscard]] auto is_defined(ValueId value) const -> bool {
        return defs_.count(value) > 0;
    }

    [[nodiscard]] auto value_count() const -> size_t {
        return defs_.size();
    }

private:
    std::unordered_map<ValueId, DefSite> defs_;
    std::unordered_map<ValueId, std::vector<UsePosition>> uses_;
};

} // namespace sift::ir
