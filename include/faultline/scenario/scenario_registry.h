#pragma once

#include <faultline/core/async.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace faultline::scenario {

// Tracks the cancellation tokens of in-flight scenarios.
class ScenarioRegistry {
public:
    class Registration {
    public:
        Registration(ScenarioRegistry& registry, std::uint64_t id, CancellationToken token)
            : registry_(&registry), id_(id), token_(std::move(token)) {}
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        ~Registration() { registry_->remove(id_); }

        const CancellationToken& token() const { return token_; }
        std::uint64_t id() const { return id_; }

    private:
        ScenarioRegistry* registry_;
        std::uint64_t id_;
        CancellationToken token_;
    };

    // The returned handle unregisters on destruction
    std::unique_ptr<Registration> add();

    // Cancels every active scenario; returns how many were signalled
    std::size_t cancelAll();

    std::size_t active() const;

private:
    void remove(std::uint64_t id);

    mutable std::mutex mutex_;
    std::uint64_t nextId_ = 1;
    std::map<std::uint64_t, CancellationToken> tokens_;
};

} // namespace faultline::scenario
