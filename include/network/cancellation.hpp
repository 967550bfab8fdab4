#ifndef FDFS_NETWORK_CANCELLATION_HPP
#define FDFS_NETWORK_CANCELLATION_HPP

#include <functional>
#include <mutex>

namespace fdfs {
namespace network {

// Aborts an in-flight cooperative operation from any thread.
// Once cancelled a signal stays cancelled; use a fresh one per operation.
class CancellationSignal {
public:
    using Closer = std::function<void()>;

    CancellationSignal() = default;
    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    // ---- CONTROL ----
    // Marks the signal and closes the attached connection, if any
    void cancel();
    bool cancelled() const;

    // ---- TRANSPORT HOOKS ----
    // Registers the closer of the current connection; false if already cancelled
    bool attach(Closer closer);
    void detach();

private:
    mutable std::mutex mutex_;
    bool cancelled_ = false;
    Closer closer_;
};

} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_CANCELLATION_HPP
