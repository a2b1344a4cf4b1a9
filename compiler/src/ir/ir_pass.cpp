// IR Optimization Pass Infrastructure Implementation

#include "ir/ir_pass.hpp"

namespace sift::ir {

auto FunctionPass::run(Module& module) -> bool {
    bool changed = false;
    for (auto& func : module.functions) {
        if (func.is_declaration) {
            continue;
        }
        changed |= run_on_function(func);
    }
    return changed;
}

} // namespace sift::ir
