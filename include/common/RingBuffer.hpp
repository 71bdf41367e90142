#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace tsepush {

    // Function: RingBuffer
    // Description: Bounded lock-free Multi-Producer-Single-Consumer ring buffer.
    //              Each slot carries a sequence number so that concurrent producers
    //              claim distinct slots with a single CAS on the head index.
    //              Enforces power-of-2 size for bitwise operations.
    template<typename T, size_t Size>
    class RingBuffer {
        static_assert((Size & (Size - 1)) == 0, "Buffer size must be a power of 2");

        // Align each slot to 64 bytes to prevent false sharing between adjacent slots
        struct alignas(64) Slot {
            std::atomic<size_t> sequence;
            T value;
        };

        Slot buffer[Size];

        alignas(64) std::atomic<size_t> head{0};
        alignas(64) std::atomic<size_t> tail{0};

    public:
        RingBuffer() {
            for (size_t i = 0; i < Size; ++i) {
                buffer[i].sequence.store(i, std::memory_order_relaxed);
            }
        }

        RingBuffer(const RingBuffer&) = delete;
        RingBuffer& operator=(const RingBuffer&) = delete;

        // Function: push
        // Description: Pushes an item into the buffer. Safe from any number of threads.
        // Inputs: item - The data to push.
        // Outputs: Returns true if successful, false if buffer is full.
        bool push(const T& item) {
            size_t pos = head.load(std::memory_order_relaxed);
            for (;;) {
                Slot& slot = buffer[pos & (Size - 1)];
                size_t seq = slot.sequence.load(std::memory_order_acquire);
                intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
                if (diff == 0) {
                    if (head.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                        slot.value = item;
                        slot.sequence.store(pos + 1, std::memory_order_release);
                        return true;
                    }
                } else if (diff < 0) {
                    return false;
                } else {
                    pos = head.load(std::memory_order_relaxed);
                }
            }
        }

        // Function: pop
        // Description: Pops an item from the buffer. Single consumer only.
        // Inputs: item - Reference to store the popped data.
        // Outputs: Returns true if successful, false if buffer is empty.
        bool pop(T& item) {
            size_t pos = tail.load(std::memory_order_relaxed);
            Slot& slot = buffer[pos & (Size - 1)];
            size_t seq = slot.sequence.load(std::memory_order_acquire);
            if (static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1) < 0) {
                return false;
            }
            item = slot.value;
            slot.sequence.store(pos + Size, std::memory_order_release);
            tail.store(pos + 1, std::memory_order_relaxed);
            return true;
        }

        bool isEmpty() const {
            return head.load(std::memory_order_acquire) == tail.load(std::memory_order_acquire);
        }

        size_t size() const {
            size_t current_head = head.load(std::memory_order_relaxed);
            size_t current_tail = tail.load(std::memory_order_relaxed);
            return current_head - current_tail;
        }
    };

}
