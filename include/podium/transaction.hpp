#ifndef PODIUM_TRANSACTION_HPP
#define PODIUM_TRANSACTION_HPP

#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include "events.hpp"
#include "logging.hpp"

namespace podium {

// =============================================================================
// Transaction - undo journal for one protocol call
//
// - Each applied mutation registers its inverse with on_rollback()
// - The destructor replays inverses newest-first unless commit() ran
// - Events queued with emit() are handed back by commit(); the caller
//   publishes them once its locks are released
// =============================================================================

class Transaction {
public:
    Transaction() = default;

    ~Transaction() {
        if (!committed_) rollback();
    }

    // Non-copyable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void on_rollback(std::function<void()> undo) {
        undo_.push_back(std::move(undo));
    }

    void emit(Event event) {
        pending_.push_back(std::move(event));
    }

    // Keeps every applied mutation and returns the queued events
    [[nodiscard]] std::vector<Event> commit() {
        committed_ = true;
        undo_.clear();
        return std::exchange(pending_, {});
    }

    bool is_committed() const { return committed_; }

private:
    void rollback() noexcept {
        // Inverses only restore state this call created while holding the
        // entity lock; a failing one is reported and the rest still run.
        for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
            try {
                (*it)();
            } catch (const std::exception& e) {
                PODIUM_LOG_ERROR("rollback step failed",
                                 {observability::string_field("error", e.what())});
            }
        }
        undo_.clear();
        pending_.clear();
    }

    std::vector<std::function<void()>> undo_;
    std::vector<Event> pending_;
    bool committed_ = false;
};

} // namespace podium

#endif // PODIUM_TRANSACTION_HPP
