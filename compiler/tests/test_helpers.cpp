#include "test_helpers.hpp"

namespace sift::test {

void add_phi_incoming(ir::Function& func, ir::Value phi, ir::Value value, ir::BlockId pred) {
    for (auto& block : func.blocks) {
        for (auto& inst : block.instructions) {
            if (inst.result != phi.id) {
                continue;
            }
            if (auto* p = std::get_if<ir::PhiInst>(&inst.inst)) {
                p->incoming.emplace_back(value, pred);
            }
            return;
        }
    }
}

auto find_block(const ir::Function& func, const std::string& name) -> const ir::BasicBlock* {
    for (const auto& block : func.blocks) {
        if (block.name == name) {
            return &block;
        }
    }
    return nullptr;
}

auto find_def(const ir::Function& func, ir::ValueId value) -> const ir::InstructionData* {
    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (inst.result == value) {
                return &inst;
            }
        }
    }
    return nullptr;
}

LogCapture::LogCapture(log::LogLevel level, const std::string& filter) {
    log::LogConfig config;
    config.level = level;
    config.filter_spec = filter;
    config.console = false;
    log::Logger::init(config);

    auto sink = std::make_unique<log::MemorySink>();
    sink_ = sink.get();
    log::Logger::instance().add_sink(std::move(sink));
}

LogCapture::~LogCapture() {
    log::Logger::init(log::LogConfig{});
}

} // namespace sift::test
