#pragma once

#include <atomic>
#include <memory>
#include "ignition/common/Errors.hpp"

namespace ignition {

// CancellationToken: разделяемый сигнал кооперативной отмены
// Копии токена указывают на одно и то же состояние
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { state_->store(true); } // Подать сигнал
    bool isCancelled() const noexcept { return state_->load(); } // Сигнал подан?

    // Бросить OperationCancelledError, если сигнал подан
    void throwIfCancelled() const {
        if (isCancelled()) throw OperationCancelledError();
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace ignition
