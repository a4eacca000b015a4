/**
 * @file ValveEdgeQueue.cpp
 * @brief Valve transitions waiting to be posted on the EventBus.
 */

#include "Modules/ValveModule/ValveEdgeQueue.h"

bool ValveEdgeQueue::push(const ValveChangedPayload& e)
{
    bool kept = true;
    if (count_ == CAPACITY) {
        head_ = (uint8_t)((head_ + 1) % CAPACITY);
        --count_;
        ++dropped_;
        kept = false;
    }
    items_[(head_ + count_) % CAPACITY] = e;
    ++count_;
    return kept;
}
