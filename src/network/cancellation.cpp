#include "network/cancellation.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace network {

void CancellationSignal::cancel() {
  Closer closer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    closer = std::move(closer_);
    closer_ = nullptr;
  }

  BOOST_LOG_TRIVIAL(debug) << "Cancellation: Signal raised";
  if (closer) {
    closer();
  }
}

bool CancellationSignal::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationSignal::attach(Closer closer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return false;
  }
  closer_ = std::move(closer);
  return true;
}

void CancellationSignal::detach() {
  std::lock_guard<std::mutex> lock(mutex_);
  closer_ = nullptr;
}

} // namespace network
} // namespace fdfs
