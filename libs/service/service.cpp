/**
 * @file service.cpp
 * @brief Verification worker pool
 */

#include "cverify/service.hpp"

#include "cverify/log.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace cverify::service {

VerificationService::VerificationService(std::shared_ptr<pipeline::VerificationPipeline> pipeline,
                                         std::size_t workers)
    : m_pipeline(std::move(pipeline))
    , m_workers(std::max<std::size_t>(workers, 1))
{}

VerificationService::~VerificationService()
{
    stop();
}

bool VerificationService::start(CompletionHandler on_complete)
{
    if (m_running.load()) {
        log::warn("service", "already running");
        return false;
    }
    m_on_complete = std::move(on_complete);
    {
        std::lock_guard lock(m_mutex);
        m_shutdown = false;
    }
    m_running.store(true);

    try {
        m_threads.reserve(m_workers);
        for (std::size_t i = 0; i < m_workers; ++i) {
            m_threads.emplace_back(&VerificationService::worker_loop, this, i);
        }
    } catch (const std::system_error& ex) {
        log::error("service", "failed to start workers: {}", ex.what());
        stop();
        return false;
    }
    log::info("service", "started {} workers", m_workers);
    return true;
}

void VerificationService::stop()
{
    if (!m_running.exchange(false)) {
        return;
    }
    {
        std::lock_guard lock(m_mutex);
        m_shutdown = true;
    }
    m_job_available.notify_all();
    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();
    log::info("service", "stopped");
}

cverify::Result<pipeline::Accepted> VerificationService::submit(const pipeline::SubmitRequest& request)
{
    auto accepted = m_pipeline->submit(request);
    if (!accepted) {
        return accepted;
    }
    if (!enqueue(*accepted)) {
        // The pending record stays owned by this instance; a sweep can requeue it.
        return std::unexpected(Error::make(
            "InfrastructureError", "service is not running; job " + accepted->job_id + " was not queued"));
    }
    return accepted;
}

bool VerificationService::enqueue(pipeline::Accepted job)
{
    {
        std::lock_guard lock(m_mutex);
        if (!m_running.load() || m_shutdown) {
            return false;
        }
        log::debug("service", "queued job {} for {}", job.job_id, job.address);
        m_queue.push(std::move(job));
    }
    m_job_available.notify_one();
    return true;
}

void VerificationService::wait_idle()
{
    std::unique_lock lock(m_mutex);
    m_idle.wait(lock, [this] { return m_queue.empty() && m_active == 0; });
}

void VerificationService::worker_loop(std::size_t worker_id)
{
    log::debug("service", "worker {} started", worker_id);
    while (true) {
        pipeline::Accepted job;
        {
            std::unique_lock lock(m_mutex);
            m_job_available.wait(lock, [this] { return !m_queue.empty() || m_shutdown; });
            if (m_queue.empty()) {
                break;
            }
            job = std::move(m_queue.front());
            m_queue.pop();
            ++m_active;
        }

        cverify::Result<store::ContractRecord> result = std::unexpected(Error::make("InfrastructureError", "not run"));
        try {
            result = m_pipeline->run_job(job.address, job.job_id);
        } catch (const std::exception& ex) {
            result = std::unexpected(Error::make("InfrastructureError", ex.what()));
        }
        if (!result) {
            log::error("service",
                       "worker {} job {} for {}: {}: {}",
                       worker_id,
                       job.job_id,
                       job.address,
                       result.error().code,
                       result.error().message);
        }
        if (m_on_complete) {
            try {
                m_on_complete(job, result);
            } catch (const std::exception& ex) {
                log::error("service", "completion handler for {} threw: {}", job.address, ex.what());
            }
        }

        {
            std::lock_guard lock(m_mutex);
            --m_active;
        }
        m_idle.notify_all();
    }
    log::debug("service", "worker {} stopped", worker_id);
}

}  // namespace cverify::service
