#pragma once

/**
 * @file service.hpp
 * @brief Bounded worker pool running verification jobs
 */

#include "cverify/pipeline.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace cverify::service {

/// Called on the worker thread once a job has been finalized (or could not be)
using CompletionHandler = std::function<void(const pipeline::Accepted&, const cverify::Result<store::ContractRecord>&)>;

class VerificationService
{
public:
    VerificationService(std::shared_ptr<pipeline::VerificationPipeline> pipeline, std::size_t workers);
    ~VerificationService();

    VerificationService(const VerificationService&) = delete;
    VerificationService& operator=(const VerificationService&) = delete;
    VerificationService(VerificationService&&) = delete;
    VerificationService& operator=(VerificationService&&) = delete;

    [[nodiscard]] bool start(CompletionHandler on_complete = {});

    /// Finish queued jobs, then join the workers
    void stop();

    /**
     * Submit through the pipeline and queue the accepted job.
     */
    [[nodiscard]] cverify::Result<pipeline::Accepted> submit(const pipeline::SubmitRequest& request);

    /// Queue an already accepted job (e.g. after requeue)
    [[nodiscard]] bool enqueue(pipeline::Accepted job);

    /// Block until the queue is empty and no job is running
    void wait_idle();

    [[nodiscard]] bool is_running() const noexcept { return m_running.load(); }
    [[nodiscard]] std::size_t worker_count() const noexcept { return m_workers; }

private:
    void worker_loop(std::size_t worker_id);

    std::shared_ptr<pipeline::VerificationPipeline> m_pipeline;
    std::size_t m_workers;
    CompletionHandler m_on_complete;

    std::atomic<bool> m_running{false};
    bool m_shutdown = false;
    std::size_t m_active = 0;

    std::mutex m_mutex;
    std::condition_variable m_job_available;
    std::condition_variable m_idle;
    std::queue<pipeline::Accepted> m_queue;

    std::vector<std::thread> m_threads;
};

}  // namespace cverify::service
