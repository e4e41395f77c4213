#ifndef __PE_ACTIVE_SESSION_REGISTRY__
#define __PE_ACTIVE_SESSION_REGISTRY__

#include "ChildSession.hpp"

namespace pe {
/**
 * @brief Holds the one session that operations without an explicit session
 * apply to.  Swapping is atomic; it never tears anything down.
 */
class ActiveSessionRegistry {
 public:
  /** @brief Installs @p session (or nothing) and returns the previous one. */
  shared_ptr<ChildSession> setActive(shared_ptr<ChildSession> session);

  shared_ptr<ChildSession> current();

 protected:
  std::mutex mutex;
  shared_ptr<ChildSession> active;
};
}  // namespace pe

#endif  // __PE_ACTIVE_SESSION_REGISTRY__
