#ifndef __PV_EVENT_REGISTRY__
#define __PV_EVENT_REGISTRY__

#include "Headers.hpp"

namespace pv {
/**
 * @brief Typed publish/subscribe list for one component's event struct.
 *
 * Listeners are invoked in subscription order.  A listener may subscribe or
 * unsubscribe (itself included) while an event is being emitted; the change
 * takes effect on the next emit.
 */
template <typename EventT>
class EventRegistry {
 public:
  typedef std::function<void(const EventT&)> Listener;

  EventRegistry() : nextHandle(1) {}

  /** @return A handle accepted by unsubscribe(). */
  int subscribe(Listener listener) {
    int handle = nextHandle++;
    listeners[handle] = listener;
    return handle;
  }

  /** @return false if the handle was not subscribed. */
  bool unsubscribe(int handle) { return listeners.erase(handle) > 0; }

  void emit(const EventT& event) {
    auto snapshot = listeners;
    for (auto& it : snapshot) {
      it.second(event);
    }
  }

  void clear() { listeners.clear(); }

  size_t size() const { return listeners.size(); }

 protected:
  map<int, Listener> listeners;
  int nextHandle;
};
}  // namespace pv

#endif  // __PV_EVENT_REGISTRY__
