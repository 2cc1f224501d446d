#ifndef MODULE_SEQUENCER_HPP
#define MODULE_SEQUENCER_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace ArbitrageControl {
namespace Control {

/**
 * One mutex per sequencing key. The facade keys by the backend resource a
 * module maps to, so module names that alias one resource share a lock while
 * distinct resources proceed concurrently.
 * Mutexes are created on first use and live as long as the sequencer.
 */
class ModuleSequencer {
private:
    std::mutex registry_mutex;
    std::map<std::string, std::shared_ptr<std::mutex>> module_mutexes;

    std::shared_ptr<std::mutex> mutex_for(const std::string& module);

public:
    class ModuleLock {
    private:
        std::shared_ptr<std::mutex> module_mutex;
        std::unique_lock<std::mutex> lock;

    public:
        explicit ModuleLock(std::shared_ptr<std::mutex> mutex_to_hold);
        ModuleLock();
    };

    // enabled=false yields a lock that holds nothing
    ModuleLock acquire(const std::string& module, bool enabled = true);

    size_t tracked_module_count();
};

} // namespace Control
} // namespace ArbitrageControl

#endif // MODULE_SEQUENCER_HPP
