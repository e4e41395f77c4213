#include "ActiveSessionRegistry.hpp"

namespace pe {
shared_ptr<ChildSession> ActiveSessionRegistry::setActive(
    shared_ptr<ChildSession> session) {
  lock_guard<std::mutex> guard(mutex);
  active.swap(session);
  return session;
}

shared_ptr<ChildSession> ActiveSessionRegistry::current() {
  lock_guard<std::mutex> guard(mutex);
  return active;
}
}  // namespace pe
