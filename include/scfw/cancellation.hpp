#pragma once

#include <atomic>
#include <memory>

namespace scfw {

// ============================================================================
// Cooperative Cancellation
// ============================================================================

// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    friend CancellationToken& interrupt_token();
    friend void install_interrupt_handlers();
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Process-wide token, cancelled by SIGINT / SIGTERM once
// install_interrupt_handlers() has been called.
CancellationToken& interrupt_token();

// Route SIGINT and SIGTERM to interrupt_token()
void install_interrupt_handlers();

} // namespace scfw
