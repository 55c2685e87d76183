#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

namespace respool {

/**
 * Reference: "Bounded MPMC queue" by Dmitry Vyukov
 * http://www.1024cores.net/home/lock-free-algorithms/queues/bounded-mpmc-queue
 *
 * Variant with a runtime capacity that need not be a power of two.
 * The slot array is rounded up to a power of two (at least 2, the
 * algorithm needs two slots to tell "full" from "empty"), and a
 * reservation counter keeps the number of stored items at or below
 * the requested capacity. The counter's top bit marks the buffer
 * closed: once set, every tryEnqueue fails while tryDequeue keeps
 * handing out what is left.
 *
 * All operations are non-blocking. drain() is the one exception: it
 * spins until producers that reserved before close() have published.
 */
template <typename T>
class BoundedRingBuffer {
   private:
    struct Slot {
        std::atomic<size_t> sequence{0};
        T data{};
    };

    static constexpr size_t kClosedBit = size_t{1} << (sizeof(size_t) * 8 - 1);

    static size_t slotCountFor(size_t capacity) {
        if (capacity == 0 || capacity > (kClosedBit >> 1)) {
            throw std::invalid_argument("BoundedRingBuffer: capacity out of range");
        }
        size_t n = 2;
        while (n < capacity) {
            n <<= 1;
        }
        return n;
    }

   public:
    explicit BoundedRingBuffer(size_t capacity)
        : capacity_(capacity),
          slot_count_(slotCountFor(capacity)),
          mask_(slot_count_ - 1),
          slots_(std::make_unique<Slot[]>(slot_count_)) {
        for (size_t i = 0; i < slot_count_; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    BoundedRingBuffer(const BoundedRingBuffer&) = delete;
    BoundedRingBuffer& operator=(const BoundedRingBuffer&) = delete;

    /**
     * @return true if stored; false if the buffer is full or closed.
     * On false the item is left untouched.
     */
    bool tryEnqueue(T&& item) {
        size_t state = state_.load(std::memory_order_acquire);
        do {
            if ((state & kClosedBit) != 0 || state >= capacity_) {
                return false;
            }
        } while (!state_.compare_exchange_weak(state, state + 1, std::memory_order_acq_rel,
                                               std::memory_order_acquire));

        publish(std::move(item));
        return true;
    }

    bool tryEnqueue(const T& item) {
        T copy = item;
        return tryEnqueue(std::move(copy));
    }

    /**
     * @return true if an item was moved into `item`; false if empty.
     * May also return false while a producer that already reserved
     * space is still writing its slot.
     */
    bool tryDequeue(T& item) {
        size_t pos = tail_.load(std::memory_order_relaxed);
        while (true) {
            Slot& slot = slots_[pos & mask_];
            size_t seq = slot.sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);

            if (diff == 0) {
                if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_acq_rel,
                                                std::memory_order_relaxed)) {
                    item = std::move(slot.data);
                    slot.data = T{};
                    slot.sequence.store(pos + slot_count_, std::memory_order_release);
                    state_.fetch_sub(1, std::memory_order_acq_rel);
                    return true;
                }
            } else if (diff < 0) {
                return false;
            } else {
                pos = tail_.load(std::memory_order_relaxed);
            }
        }
    }

    // Reject all further enqueues. Idempotent.
    void close() { state_.fetch_or(kClosedBit, std::memory_order_acq_rel); }

    bool isClosed() const { return (state_.load(std::memory_order_acquire) & kClosedBit) != 0; }

    // Items stored or being stored; a snapshot.
    size_t size() const { return state_.load(std::memory_order_acquire) & ~kClosedBit; }

    size_t capacity() const { return capacity_; }

    /**
     * Close the buffer and hand every remaining item to `fn`.
     * Items taken concurrently by other consumers are not passed to `fn`.
     * @return number of items passed to `fn`
     */
    template <typename Fn>
    size_t drain(Fn&& fn) {
        close();
        size_t drained = 0;
        T item{};
        while (size() > 0) {
            if (tryDequeue(item)) {
                fn(item);
                item = T{};
                ++drained;
            } else {
                std::this_thread::yield();
            }
        }
        return drained;
    }

   private:
    // A reservation guarantees the slot at head_ is free or about to be freed
    // by a consumer that has not yet released its reservation.
    void publish(T&& item) {
        size_t pos = head_.load(std::memory_order_relaxed);
        while (true) {
            Slot& slot = slots_[pos & mask_];
            size_t seq = slot.sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);

            if (diff == 0) {
                if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_acq_rel,
                                                std::memory_order_relaxed)) {
                    slot.data = std::move(item);
                    slot.sequence.store(pos + 1, std::memory_order_release);
                    return;
                }
            } else if (diff < 0) {
                std::this_thread::yield();
                pos = head_.load(std::memory_order_relaxed);
            } else {
                pos = head_.load(std::memory_order_relaxed);
            }
        }
    }

    const size_t capacity_;
    const size_t slot_count_;
    const size_t mask_;
    std::unique_ptr<Slot[]> slots_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
    std::atomic<size_t> state_{0};
};

} // namespace respool
