#include "module_sequencer.hpp"

namespace ArbitrageControl {
namespace Control {

ModuleSequencer::ModuleLock::ModuleLock(std::shared_ptr<std::mutex> mutex_to_hold)
    : module_mutex(std::move(mutex_to_hold)), lock(*module_mutex) {}

ModuleSequencer::ModuleLock::ModuleLock() = default;

std::shared_ptr<std::mutex> ModuleSequencer::mutex_for(const std::string& module) {
    std::lock_guard<std::mutex> registry_lock(registry_mutex);
    auto& module_mutex = module_mutexes[module];
    if (!module_mutex) {
        module_mutex = std::make_shared<std::mutex>();
    }
    return module_mutex;
}

ModuleSequencer::ModuleLock ModuleSequencer::acquire(const std::string& module, bool enabled) {
    if (!enabled) {
        return ModuleLock();
    }
    return ModuleLock(mutex_for(module));
}

size_t ModuleSequencer::tracked_module_count() {
    std::lock_guard<std::mutex> registry_lock(registry_mutex);
    return module_mutexes.size();
}

} // namespace Control
} // namespace ArbitrageControl
