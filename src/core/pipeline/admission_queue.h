#pragma once

#include "core/shared/types.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace gf {

struct AdmissionStats {
    size_t depth = 0;
    size_t capacity = 0;
    int generationSlots = 0;
    int activeGenerations = 0;
    size_t rejected = 0;
    bool isShutdown = false;
};

// AdmissionQueue: the single gate in front of the GPU-bound generation
// stage.
//
// Jobs wait in FIFO order, at most |capacity| of them; tryEnqueue() refuses
// instead of blocking once the queue is full. acquire() hands out the oldest
// job together with a GenerationPermit, and no more than |generationSlots|
// permits are alive at once. The permit returns its slot when released or
// destroyed, so a worker holds it only for the generation call itself.
class AdmissionQueue {
public:
    class GenerationPermit {
    public:
        GenerationPermit() = default;
        ~GenerationPermit();

        GenerationPermit(GenerationPermit&& other) noexcept;
        GenerationPermit& operator=(GenerationPermit&& other) noexcept;
        GenerationPermit(const GenerationPermit&) = delete;
        GenerationPermit& operator=(const GenerationPermit&) = delete;

        bool isHeld() const { return m_queue != nullptr; }
        void release();

    private:
        friend class AdmissionQueue;
        explicit GenerationPermit(AdmissionQueue* queue) : m_queue(queue) {}

        AdmissionQueue* m_queue = nullptr;
    };

    struct Admitted {
        JobId jobId;
        GenerationPermit permit;
    };

    AdmissionQueue(size_t capacity, int generationSlots);
    ~AdmissionQueue();

    AdmissionQueue(const AdmissionQueue&) = delete;
    AdmissionQueue& operator=(const AdmissionQueue&) = delete;
    AdmissionQueue(AdmissionQueue&&) = delete;
    AdmissionQueue& operator=(AdmissionQueue&&) = delete;

    // False when the queue is full or shut down; the job is not queued.
    bool tryEnqueue(const JobId& jobId);

    // Drops a waiting job. False when it is not queued (already admitted).
    bool remove(const JobId& jobId);

    bool contains(const JobId& jobId) const;
    bool isFull() const;

    // Counts a job refused before tryEnqueue() was reached.
    void recordRejection();

    // Blocks until a job is waiting and a generation slot is free. Returns
    // nullopt once shutdown() has been called.
    std::optional<Admitted> acquire();

    // Wakes every waiter; acquire() and tryEnqueue() fail from now on.
    void shutdown();

    // Re-opens a queue after shutdown(). Waiting jobs are kept.
    void reopen();

    size_t size() const;
    size_t capacity() const { return m_capacity; }
    AdmissionStats stats() const;

private:
    void releaseSlot();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;

    std::deque<JobId> m_waiting;
    const size_t m_capacity;
    const int m_generationSlots;
    int m_activeGenerations = 0;
    size_t m_rejected = 0;
    bool m_shutdown = false;
};

} // namespace gf
