#pragma once
/**
 * @file ValveEdgeQueue.h
 * @brief Valve transitions waiting to be posted on the EventBus.
 *
 * Edges keep the timestamp of the transition, so a late delivery still gives
 * the runtime tracker the real run duration. Not thread safe: the valve
 * module serializes access with its mutex.
 */

#include <stdint.h>

#include "Core/EventBus/EventPayloads.h"
#include "Core/SystemLimits.h"

class ValveEdgeQueue {
public:
    static constexpr uint8_t CAPACITY = Limits::Irrigation::ValveEdgeQueueLen;

    /** Appends `e`. When full the oldest edge is dropped and false is returned. */
    bool push(const ValveChangedPayload& e);

    /**
     * Hands queued edges to `post` oldest first and stops at the first one it
     * refuses. Returns the number delivered.
     */
    template<typename PostFn>
    uint8_t drain(PostFn post)
    {
        uint8_t delivered = 0;
        while (count_ > 0) {
            if (!post(items_[head_])) break;
            head_ = (uint8_t)((head_ + 1) % CAPACITY);
            --count_;
            ++delivered;
        }
        return delivered;
    }

    bool empty() const { return count_ == 0; }
    uint8_t size() const { return count_; }
    uint32_t droppedCount() const { return dropped_; }

private:
    ValveChangedPayload items_[CAPACITY]{};
    uint8_t head_ = 0;
    uint8_t count_ = 0;
    uint32_t dropped_ = 0;
};
