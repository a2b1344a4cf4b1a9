// Dead Code Elimination Transformer Implementation

#include "ir/passes/dce_transform.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace sift::ir {

namespace {

template <typename Pred> void erase_ids_if(std::vector<BlockId>& ids, Pred pred) {
    ids.erase(std::remove_if(ids.begin(), ids.end(), pred), ids.end());
}

// Every pointer some load in the function reads through
auto collect_loaded_pointers(const Function& func) -> std::unordered_set<ValueId> {
    std::unordered_set<ValueId> loaded;
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (const auto* load = std::get_if<LoadInst>(&inst.inst)) {
                loaded.insert(load->ptr.id);
            }
        }
    }
    return loaded;
}

} // namespace

// ============================================================================
// Block Removal
// ============================================================================

auto DceTransformer::remove_unreachable_blocks(Function& func, const ReachableSet& reachable)
    -> size_t {
    std::unordered_set<BlockId> removed;
    for (const auto& block : func.blocks) {
        if (!reachable.contains(block.id)) {
            removed.insert(block.id);
        }
    }
    if (removed.empty()) {
        return 0;
    }

    auto is_removed = [&removed](BlockId id) { return removed.count(id) > 0; };

    for (auto& block : func.blocks) {
        if (is_removed(block.id)) {
            continue;
        }
        erase_ids_if(block.predecessors, is_removed);
        erase_ids_if(block.successors, is_removed);

        // Matched by predecessor id, never by position
        for (auto& inst : block.instructions) {
            if (auto* phi = std::get_if<PhiInst>(&inst.inst)) {
                phi->incoming.erase(std::remove_if(phi->incoming.begin(), phi->incoming.end(),
                                                   [&is_removed](const auto& entry) {
                                                       return is_removed(entry.second);
                                                   }),
                                    phi->incoming.end());
            }
        }
    }

    for (const auto& block : func.blocks) {
        if (is_removed(block.id)) {
            SIFT_LOG_DEBUG("dce", func.name << ": removing unreachable block " << block.name
                                            << " (" << block.instructions.size()
                                            << " instructions)");
        }
    }

    func.blocks.erase(std::remove_if(func.blocks.begin(), func.blocks.end(),
                                     [&is_removed](const BasicBlock& block) {
                                         return is_removed(block.id);
                                     }),
                      func.blocks.end());

    return removed.size();
}

// ============================================================================
// Instruction Removal
// ============================================================================

auto DceTransformer::plan_instruction_removal(const Function& func, const LivenessInfo& liveness,
                                              const EscapeTable& escapes,
                                              const CallPurity& purity) const -> RemovalPlan {
    RemovalPlan plan;
    IrPrinter printer;
    auto loaded = collect_loaded_pointers(func);

    auto keep = [&](const BasicBlock& block, size_t index, ConservativeReason reason) {
        plan.decisions.push_back(ConservativeDecision{
            func.name, block.name, printer.print_instruction(block.instructions[index]), reason,
            block.id, index});
    };

    for (const auto& block : func.blocks) {
        for (size_t i = 0; i < block.instructions.size(); ++i) {
            const auto& inst = block.instructions[i];
            auto cls = classify(inst, escapes, purity);

            if (const auto* store = std::get_if<StoreInst>(&inst.inst)) {
                ValueId target = store->ptr.id;
                if (loaded.count(target) > 0) {
                    continue;
                }
                if (cls == SideEffectClass::MemoryWrite) {
                    plan.removals.push_back({block.id, i});
                } else if (escapes.is_tracked(target)) {
                    keep(block, i,
                         escapes.status(target) == EscapeStatus::Escaped
                             ? ConservativeReason::EscapedPointer
                             : ConservativeReason::MayAlias);
                }
                continue;
            }

            if (!inst.has_result() || liveness.is_live(inst.result)) {
                continue;
            }

            switch (cls) {
            case SideEffectClass::Pure:
            case SideEffectClass::MemoryRead:
                plan.removals.push_back({block.id, i});
                break;
            case SideEffectClass::MemoryWrite:
                // Allocations; stores were handled above
                plan.removals.push_back({block.id, i});
                break;
            case SideEffectClass::EffectFul:
                if (const auto* call = std::get_if<CallInst>(&inst.inst)) {
                    keep(block, i,
                         call->is_indirect() ? ConservativeReason::PotentialSideEffect
                                             : ConservativeReason::UnknownCallPurity);
                }
                break;
            }
        }
    }

    return plan;
}

auto DceTransformer::apply(Function& func, const RemovalPlan& plan) -> size_t {
    if (plan.removals.empty()) {
        return 0;
    }

    std::unordered_map<BlockId, std::unordered_set<size_t>> by_block;
    for (const auto& ref : plan.removals) {
        by_block[ref.block].insert(ref.index);
    }

    IrPrinter printer;
    size_t removed = 0;

    for (auto& block : func.blocks) {
        auto it = by_block.find(block.id);
        if (it == by_block.end()) {
            continue;
        }
        const auto& doomed = it->second;

        std::vector<InstructionData> kept;
        kept.reserve(block.instructions.size());
        for (size_t i = 0; i < block.instructions.size(); ++i) {
            if (doomed.count(i) > 0) {
                SIFT_LOG_TRACE("dce", func.name << ": " << block.name << ": removing "
                                                << printer.print_instruction(
                                                       block.instructions[i]));
                ++removed;
            } else {
                kept.push_back(std::move(block.instructions[i]));
            }
        }
        block.instructions = std::move(kept);
    }

    return removed;
}

} // namespace sift::ir
