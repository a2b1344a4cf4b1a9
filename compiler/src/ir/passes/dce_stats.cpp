// Dead Code Elimination Statistics Implementation

#include "ir/passes/dce_stats.hpp"

#include <algorithm>
#include <sstream>

namespace sift::ir {

auto reason_name(ConservativeReason reason) -> const char* {
    switch (reason) {
    case ConservativeReason::MayAlias:
        return "MayAlias";
    case ConservativeReason::UnknownCallPurity:
        return "UnknownCallPurity";
    case ConservativeReason::EscapedPointer:
        return "EscapedPointer";
    case ConservativeReason::PotentialSideEffect:
        return "PotentialSideEffect";
    }
    return "Unknown";
}

auto reason_explanation(ConservativeReason reason) -> const char* {
    switch (reason) {
    case ConservativeReason::MayAlias:
        return "target address is taken; another pointer may read it";
    case ConservativeReason::UnknownCallPurity:
        return "callee is not known to be pure";
    case ConservativeReason::EscapedPointer:
        return "target address escapes the function";
    case ConservativeReason::PotentialSideEffect:
        return "indirect call may have side effects";
    }
    return "";
}

// ============================================================================
// OptimizationStats
// ============================================================================

void OptimizationStats::add_decision(ConservativeDecision decision) {
    if (std::find(decisions.begin(), decisions.end(), decision) == decisions.end()) {
        decisions.push_back(std::move(decision));
    }
}

auto OptimizationStats::count_decisions(ConservativeReason reason) const -> size_t {
    return static_cast<size_t>(std::count_if(
        decisions.begin(), decisions.end(),
        [reason](const ConservativeDecision& d) { return d.reason == reason; }));
}

void OptimizationStats::merge(const OptimizationStats& other) {
    instructions_removed += other.instructions_removed;
    blocks_removed += other.blocks_removed;
    iterations += other.iterations;
    converged = converged && other.converged;
    liveness_converged = liveness_converged && other.liveness_converged;
    for (const auto& d : other.decisions) {
        add_decision(d);
    }
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

auto OptimizationStats::format_report(const std::string& function_name) const -> std::string {
    std::ostringstream out;
    out << function_name << ": removed " << instructions_removed << " instructions, "
        << blocks_removed << " blocks in " << iterations
        << (iterations == 1 ? " round" : " rounds");
    if (!converged) {
        out << " (did not converge)";
    }
    out << "\n";

    for (const auto& d : decisions) {
        out << "  kept [" << reason_name(d.reason) << "] " << d.block << ": " << d.instruction
            << " (" << reason_explanation(d.reason) << ")\n";
    }
    for (const auto& w : warnings) {
        out << "  warning: " << w << "\n";
    }
    return out.str();
}

// ============================================================================
// PassError
// ============================================================================

auto pass_error_kind_name(PassErrorKind kind) -> const char* {
    switch (kind) {
    case PassErrorKind::MalformedInput:
        return "MalformedInput";
    case PassErrorKind::StructuralViolation:
        return "StructuralViolation";
    }
    return "Unknown";
}

auto PassError::to_string() const -> std::string {
    return std::string(pass_error_kind_name(kind)) + " in " + function + ": " + message;
}

// ============================================================================
// ModuleReport
// ============================================================================

auto ModuleReport::stats_for(const std::string& name) const -> const OptimizationStats* {
    for (const auto& [fn, stats] : functions) {
        if (fn == name) {
            return &stats;
        }
    }
    return nullptr;
}

auto ModuleReport::failure_for(const std::string& name) const -> const PassError* {
    for (const auto& failure : failures) {
        if (failure.function == name) {
            return &failure;
        }
    }
    return nullptr;
}

auto ModuleReport::totals() const -> OptimizationStats {
    OptimizationStats total;
    for (const auto& [_, stats] : functions) {
        total.merge(stats);
    }
    return total;
}

auto ModuleReport::format() const -> std::string {
    std::ostringstream out;
    for (const auto& [fn, stats] : functions) {
        out << stats.format_report(fn);
    }
    for (const auto& failure : failures) {
        out << "failed: " << failure.to_string() << "\n";
    }

    auto total = totals();
    out << "total: " << total.instructions_removed << " instructions, " << total.blocks_removed
        << " blocks removed across " << functions.size() << " functions";
    if (!failures.empty()) {
        out << ", " << failures.size() << " failed";
    }
    out << "\n";
    return out.str();
}

} // namespace sift::ir
