#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "errors.hpp"

// Shared cancellation flag. Copies observe the same flag, so the caller
// keeps one copy to cancel() and hands another to the engine.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

    // Throws CancelledError naming the step that observed the request.
    void throw_if_cancelled(const std::string& what) const {
        if (is_cancelled()) {
            throw CancelledError("Cancelled before " + what);
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
