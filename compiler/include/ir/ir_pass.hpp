#pragma once

// IR Optimization Pass Infrastructure
//
// Passes transform IR at two granularities:
// - Module level (whole compilation unit)
// - Function level (one body at a time, declarations skipped)

#include "ir/ir.hpp"

#include <string>

namespace sift::ir {

// ============================================================================
// Pass Base Classes
// ============================================================================

// Base class for all IR passes
class IrPass {
public:
    virtual ~IrPass() = default;

    // Pass name for debugging/logging
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    // Run the pass on a module, returns true if any changes were made
    virtual auto run(Module& module) -> bool = 0;
};

// Function-level pass - operates on one function at a time, in module order
class FunctionPass : public IrPass {
public:
    auto run(Module& module) -> bool override;

protected:
    // Override this to implement function-level transformation
    virtual auto run_on_function(Function& func) -> bool = 0;
};

} // namespace sift::ir
