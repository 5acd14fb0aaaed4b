#pragma once

#include <atomic>
#include <memory>

namespace peerdrop::transfer {

// Copies share one flag. The sender polls it between chunks.
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool is_cancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

}
