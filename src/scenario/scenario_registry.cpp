#include <faultline/scenario/scenario_registry.h>

#include <spdlog/spdlog.h>

namespace faultline::scenario {

std::unique_ptr<ScenarioRegistry::Registration> ScenarioRegistry::add() {
    std::lock_guard<std::mutex> lk(mutex_);
    auto id = nextId_++;
    CancellationToken token;
    tokens_.emplace(id, token);
    return std::make_unique<Registration>(*this, id, token);
}

std::size_t ScenarioRegistry::cancelAll() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& [id, token] : tokens_) {
        token.cancel();
        spdlog::info("[ScenarioRegistry] cancelled scenario #{}", id);
    }
    return tokens_.size();
}

std::size_t ScenarioRegistry::active() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return tokens_.size();
}

void ScenarioRegistry::remove(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mutex_);
    tokens_.erase(id);
}

} // namespace faultline::scenario
