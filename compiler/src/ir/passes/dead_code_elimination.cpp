// Dead Code Elimination Optimization Pass Implementation

#include "ir/passes/dead_code_elimination.hpp"

#include "ir/analysis/escape.hpp"
#include "ir/analysis/liveness.hpp"
#include "ir/analysis/reachability.hpp"
#include "ir/passes/dce_transform.hpp"
#include "ir/verify.hpp"
#include "log/log.hpp"

namespace sift::ir {

DeadCodeEliminationPass::DeadCodeEliminationPass() : DeadCodeEliminationPass(DceConfig{}) {}

DeadCodeEliminationPass::DeadCodeEliminationPass(DceConfig config) : config_(config) {
    if (config_.max_iterations == 0) {
        SIFT_LOG_WARN("dce", "max_iterations of 0 raised to 1");
        config_.max_iterations = 1;
    }
    if (config_.max_liveness_iterations == 0) {
        SIFT_LOG_WARN("dce", "max_liveness_iterations of 0 raised to 1");
        config_.max_liveness_iterations = 1;
    }
    // Liveness stays below the round cap; a cap of one round leaves it at its floor
    if (config_.max_iterations > 1 && config_.max_liveness_iterations >= config_.max_iterations) {
        SIFT_LOG_WARN("dce", "max_liveness_iterations of " << config_.max_liveness_iterations
                                                           << " lowered to "
                                                           << config_.max_iterations - 1);
        config_.max_liveness_iterations = config_.max_iterations - 1;
    }
}

auto DeadCodeEliminationPass::run(Module& module) -> bool {
    report_ = ModuleReport{};
    module_ = &module;

    bool changed = FunctionPass::run(module);

    module_ = nullptr;

    if (config_.print_statistics) {
        SIFT_LOG_INFO("dce", "module " << module.name << "\n" << report_.format());
    }
    return changed;
}

auto DeadCodeEliminationPass::run_on_function(Function& func) -> bool {
    auto result = optimize(func, module_);
    if (is_err(result)) {
        const auto& err = unwrap_err(result);
        SIFT_LOG_ERROR("dce", err.to_string());
        report_.failures.push_back(err);
        return false;
    }

    auto& stats = unwrap(result);
    bool changed = stats.had_effect();

    if (config_.verify) {
        auto verified = verify_function(func);
        if (is_err(verified)) {
            PassError err{PassErrorKind::StructuralViolation, func.name,
                          unwrap_err(verified).to_string()};
            SIFT_LOG_ERROR("verify", err.to_string());
            report_.failures.push_back(std::move(err));
            return changed;
        }
    }

    report_.functions.emplace_back(func.name, std::move(stats));
    return changed;
}

auto DeadCodeEliminationPass::optimize(Function& func, const Module* context)
    -> Result<OptimizationStats, PassError> {
    OptimizationStats stats;
    if (func.is_declaration) {
        return stats;
    }

    auto valid = verify_function(func);
    if (is_err(valid)) {
        return PassError{PassErrorKind::MalformedInput, func.name,
                         unwrap_err(valid).to_string()};
    }

    if (config_.trust_pure_attribute && !context) {
        SIFT_LOG_DEBUG("dce", func.name << ": no module context, calls are not trusted as pure");
    }
    CallPurity purity{context, config_.trust_pure_attribute};

    ReachabilityAnalyzer reachability;
    DceTransformer transformer;
    stats.converged = false;

    for (size_t round = 1; round <= config_.max_iterations; ++round) {
        stats.iterations = round;

        auto reachable = reachability.analyze(func);
        size_t blocks = transformer.remove_unreachable_blocks(func, reachable);
        size_t insts = sweep_instructions(func, purity, stats);

        stats.blocks_removed += blocks;
        stats.instructions_removed += insts;

        SIFT_LOG_DEBUG("dce", func.name << ": round " << round << " removed " << blocks
                                        << " blocks, " << insts << " instructions");

        if (blocks == 0 && insts == 0) {
            stats.converged = true;
            break;
        }
    }

    if (!stats.converged) {
        std::string warning = "did not converge after " + std::to_string(config_.max_iterations) +
                              " rounds";
        SIFT_LOG_WARN("dce", func.name << ": " << warning);
        stats.warnings.push_back(std::move(warning));
    }

    for (const auto& d : stats.decisions) {
        SIFT_LOG_TRACE("dce", func.name << ": kept " << d.instruction << " in " << d.block << " ["
                                        << reason_name(d.reason) << "]");
    }

    return stats;
}

auto DeadCodeEliminationPass::sweep_instructions(Function& func, const CallPurity& purity,
                                                 OptimizationStats& stats) -> size_t {
    LivenessAnalyzer liveness_analyzer(config_.max_liveness_iterations);
    EscapeAnalyzer escape_analyzer;
    DceTransformer transformer;
    size_t total = 0;

    while (true) {
        auto liveness = liveness_analyzer.analyze(func);
        if (!liveness.converged() && stats.liveness_converged) {
            stats.liveness_converged = false;
            stats.warnings.push_back("liveness did not converge after " +
                                     std::to_string(liveness.iterations()) + " iterations");
        }

        auto escapes = escape_analyzer.analyze(func);
        auto plan = transformer.plan_instruction_removal(func, liveness, escapes, purity);

        size_t removed = transformer.apply(func, plan);
        total += removed;
        if (removed == 0) {
            // The last sweep saw the function as it is now; earlier sweeps may
            // have kept instructions that were removed afterwards
            stats.decisions.clear();
            for (auto& d : plan.decisions) {
                stats.add_decision(std::move(d));
            }
            break;
        }
    }

    return total;
}

} // namespace sift::ir
