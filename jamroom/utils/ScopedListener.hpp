#pragma once

#include <functional>
#include <utility>

namespace jamroom {

/**
 * Owns one listener registration on a session component.
 *
 * The component type is erased at attach time so a single owner can hold
 * registrations on a transport, the presence registry and the track log with
 * the same member type. Declare it after the component and before the state
 * the callbacks touch; it detaches on destruction.
 */
template <typename Listener> class ScopedListener {
  public:
    explicit ScopedListener(Listener* listener) : listener_(listener) {}

    ~ScopedListener() {
        detach();
    }

    template <typename Source> void attach(Source& source) {
        detach();
        source.addListener(listener_);
        detach_ = [&source, l = listener_] { source.removeListener(l); };
    }

    void detach() {
        if (detach_)
            std::exchange(detach_, nullptr)();
    }

    bool isAttached() const {
        return static_cast<bool>(detach_);
    }

    ScopedListener(const ScopedListener&) = delete;
    ScopedListener& operator=(const ScopedListener&) = delete;

  private:
    Listener* listener_;
    std::function<void()> detach_;
};

}  // namespace jamroom
