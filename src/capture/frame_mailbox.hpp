#pragma once

#include <mutex>
#include <optional>
#include <utility>

namespace pixel_forge {

// Single-slot, newest-wins handoff between the capture thread and consumers.
// put() never blocks on the consumer; an unread value is simply replaced.
template <typename T>
class FrameMailbox {
public:
    FrameMailbox() = default;

    FrameMailbox(const FrameMailbox&) = delete;
    FrameMailbox& operator=(const FrameMailbox&) = delete;

    void put(T value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slot = std::move(value);
    }

    // Copy of the current value, slot left untouched
    std::optional<T> peek() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_slot;
    }

    std::optional<T> take() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::optional<T> value = std::move(m_slot);
        m_slot.reset();
        return value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slot.reset();
    }

    bool has_value() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_slot.has_value();
    }

private:
    mutable std::mutex m_mutex;
    std::optional<T> m_slot;
};

}  // namespace pixel_forge
