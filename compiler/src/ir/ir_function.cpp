// IR Function and Module Implementation

#include "ir/ir.hpp"

#include <algorithm>

namespace sift::ir {

namespace {

void push_unique(std::vector<BlockId>& ids, BlockId id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

} // namespace

auto successors_of(const Terminator& term) -> std::vector<BlockId> {
    std::vector<BlockId> succs;
    std::visit(
        [&succs](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, BranchTerm>) {
                succs.push_back(t.target);
            } else if constexpr (std::is_same_v<T, CondBranchTerm>) {
                succs.push_back(t.true_block);
                push_unique(succs, t.false_block);
            } else if constexpr (std::is_same_v<T, SwitchTerm>) {
                for (const auto& [_, target] : t.cases) {
                    push_unique(succs, target);
                }
                push_unique(succs, t.default_block);
            } else if constexpr (std::is_same_v<T, IndirectBranchTerm>) {
                for (auto target : t.targets) {
                    push_unique(succs, target);
                }
            }
        },
        term);
    return succs;
}

auto Function::create_block(const std::string& label) -> BlockId {
    BlockId id = next_block_id++;
    BasicBlock block;
    block.id = id;
    block.name = label.empty() ? "bb" + std::to_string(id) : label;
    blocks.push_back(std::move(block));
    return id;
}

auto Function::get_block(BlockId id) -> BasicBlock* {
    if (id < blocks.size() && blocks[id].id == id) {
        return &blocks[id];
    }
    for (auto& block : blocks) {
        if (block.id == id) {
            return &block;
        }
    }
    return nullptr;
}

auto Function::get_block(BlockId id) const -> const BasicBlock* {
    if (id < blocks.size() && blocks[id].id == id) {
        return &blocks[id];
    }
    for (const auto& block : blocks) {
        if (block.id == id) {
            return &block;
        }
    }
    return nullptr;
}

auto Function::block_index() const -> std::unordered_map<BlockId, size_t> {
    std::unordered_map<BlockId, size_t> index;
    index.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
        index.emplace(blocks[i].id, i);
    }
    return index;
}

auto Function::has_attribute(const std::string& attr) const -> bool {
    return std::find(attributes.begin(), attributes.end(), attr) != attributes.end();
}

void Function::compute_edges() {
    for (auto& block : blocks) {
        block.predecessors.clear();
        block.successors.clear();
    }

    auto index = block_index();
    for (auto& block : blocks) {
        if (!block.terminator) {
            continue;
        }
        for (auto succ_id : successors_of(*block.terminator)) {
            auto it = index.find(succ_id);
            if (it == index.end()) {
                continue;
            }
            block.successors.push_back(succ_id);
            push_unique(blocks[it->second].predecessors, block.id);
        }
    }
}

auto Function::instruction_count() const -> size_t {
    size_t count = 0;
    for (const auto& block : blocks) {
        count += block.instructions.size();
    }
    return count;
}

auto Module::get_function(const std::string& fn_name) -> Function* {
    for (auto& func : functions) {
        if (func.name == fn_name) {
            return &func;
        }
    }
    return nullptr;
}

auto Module::get_function(const std::string& fn_name) const -> const Function* {
    for (const auto& func : functions) {
        if (func.name == fn_name) {
            return &func;
        }
    }
    return nullptr;
}

} // namespace sift::ir
