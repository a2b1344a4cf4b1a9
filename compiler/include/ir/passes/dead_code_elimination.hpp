#pragma once

// Dead Code Elimination (DCE) Optimization Pass
//
// Removes unreachable blocks and instructions whose results are never used
// and whose removal cannot be observed. Each round runs
//
//   reachability -> remove unreachable blocks
//   {liveness, escape, classify -> remove instructions} until a sweep
//   removes nothing
//
// and the pass stops at the first round that removes nothing, or at the
// round cap with a "did not converge" warning. Every step only deletes, so
// stopping early is always safe.
//
// Malformed input is rejected per function before anything is touched;
// `run()` records the failure and carries on with the rest of the module.

#include "common.hpp"
#include "ir/analysis/side_effects.hpp"
#include "ir/ir_pass.hpp"
#include "ir/passes/dce_stats.hpp"

namespace sift::ir {

// Zero caps are raised to 1, and a liveness cap at or above the round cap
// is lowered to one below it.
struct DceConfig {
    size_t max_iterations = CompilerOptions::max_dce_iterations;
    size_t max_liveness_iterations = CompilerOptions::max_liveness_iterations;
    bool trust_pure_attribute = CompilerOptions::trust_pure_attribute;
    bool verify = CompilerOptions::verify_after_passes;
    bool print_statistics = CompilerOptions::print_statistics;
};

class DeadCodeEliminationPass : public FunctionPass {
public:
    DeadCodeEliminationPass();
    explicit DeadCodeEliminationPass(DceConfig config);

    [[nodiscard]] auto name() const -> std::string override {
        return "DeadCodeElimination";
    }

    // Optimizes every function with a body and rebuilds report()
    auto run(Module& module) -> bool override;

    // Optimizes one function. Declarations return empty stats. `context` is
    // the module that resolves direct callees when trust_pure_attribute is
    // set; without it every call is kept.
    auto optimize(Function& func, const Module* context = nullptr)
        -> Result<OptimizationStats, PassError>;

    [[nodiscard]] auto report() const -> const ModuleReport& {
        return report_;
    }

    [[nodiscard]] auto config() const -> const DceConfig& {
        return config_;
    }

protected:
    auto run_on_function(Function& func) -> bool override;

private:
    DceConfig config_;
    ModuleReport report_;
    const Module* module_ = nullptr; // Set for the duration of run()

    // Removes dead instructions until a sweep finds nothing; returns the count
    auto sweep_instructions(Function& func, const CallPurity& purity, OptimizationStats& stats)
        -> size_t;
};

} // namespace sift::ir
