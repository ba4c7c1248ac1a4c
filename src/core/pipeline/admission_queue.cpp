#include "core/pipeline/admission_queue.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <utility>

namespace gf {

// ── GenerationPermit ────────────────────────────────────────

AdmissionQueue::GenerationPermit::~GenerationPermit()
{
    release();
}

AdmissionQueue::GenerationPermit::GenerationPermit(GenerationPermit&& other) noexcept
    : m_queue(std::exchange(other.m_queue, nullptr))
{
}

AdmissionQueue::GenerationPermit&
AdmissionQueue::GenerationPermit::operator=(GenerationPermit&& other) noexcept
{
    if (this != &other) {
        release();
        m_queue = std::exchange(other.m_queue, nullptr);
    }
    return *this;
}

void AdmissionQueue::GenerationPermit::release()
{
    if (m_queue) {
        m_queue->releaseSlot();
        m_queue = nullptr;
    }
}

// ── Construction / destruction ──────────────────────────────

AdmissionQueue::AdmissionQueue(size_t capacity, int generationSlots)
    : m_capacity(std::max<size_t>(capacity, 1))
    , m_generationSlots(std::max(generationSlots, 1))
{
}

AdmissionQueue::~AdmissionQueue()
{
    shutdown();
}

// ── Enqueue / remove ────────────────────────────────────────

bool AdmissionQueue::tryEnqueue(const JobId& jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        LOG_WARN(gfPipeline, "AdmissionQueue::tryEnqueue() called after shutdown");
        return false;
    }
    if (m_waiting.size() >= m_capacity) {
        ++m_rejected;
        LOG_WARN(gfPipeline, "Admission queue full (%d), rejected job %s",
                 static_cast<int>(m_capacity), qPrintable(jobId));
        return false;
    }

    m_waiting.push_back(jobId);
    m_cv.notify_all();
    return true;
}

bool AdmissionQueue::remove(const JobId& jobId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = std::find(m_waiting.begin(), m_waiting.end(), jobId);
    if (it == m_waiting.end()) {
        return false;
    }
    m_waiting.erase(it);
    return true;
}

bool AdmissionQueue::contains(const JobId& jobId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::find(m_waiting.begin(), m_waiting.end(), jobId) != m_waiting.end();
}

bool AdmissionQueue::isFull() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiting.size() >= m_capacity;
}

void AdmissionQueue::recordRejection()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_rejected;
}

// ── Acquire ─────────────────────────────────────────────────

std::optional<AdmissionQueue::Admitted> AdmissionQueue::acquire()
{
    std::unique_lock<std::mutex> lock(m_mutex);

    m_cv.wait(lock, [this] {
        return m_shutdown || (!m_waiting.empty() && m_activeGenerations < m_generationSlots);
    });

    if (m_shutdown) {
        return std::nullopt;
    }

    Admitted admitted;
    admitted.jobId = m_waiting.front();
    m_waiting.pop_front();
    ++m_activeGenerations;
    admitted.permit = GenerationPermit(this);

    LOG_DEBUG(gfPipeline, "Admitted %s (queue depth=%d, generations=%d/%d)",
              qPrintable(admitted.jobId), static_cast<int>(m_waiting.size()),
              m_activeGenerations, m_generationSlots);
    return admitted;
}

void AdmissionQueue::releaseSlot()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_activeGenerations > 0) {
        --m_activeGenerations;
    }
    m_cv.notify_all();
}

// ── Shutdown ────────────────────────────────────────────────

void AdmissionQueue::shutdown()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_shutdown) {
        m_shutdown = true;
        LOG_INFO(gfPipeline, "AdmissionQueue shutting down (depth=%d, rejected=%d)",
                 static_cast<int>(m_waiting.size()), static_cast<int>(m_rejected));
        m_cv.notify_all();
    }
}

void AdmissionQueue::reopen()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shutdown = false;
}

// ── Size / stats ────────────────────────────────────────────

size_t AdmissionQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiting.size();
}

AdmissionStats AdmissionQueue::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    AdmissionStats s;
    s.depth = m_waiting.size();
    s.capacity = m_capacity;
    s.generationSlots = m_generationSlots;
    s.activeGenerations = m_activeGenerations;
    s.rejected = m_rejected;
    s.isShutdown = m_shutdown;
    return s;
}

} // namespace gf
