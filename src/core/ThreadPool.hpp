#pragma once

/**
 * ThreadPool.hpp
 * 
 * Fixed-size pool of worker threads fed from one FIFO queue.
 * With a single worker it is a serial executor: jobs run one at a time in
 * posting order. The transfer client and the event bus rely on that.
 */

#include "Logger.hpp"

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <stdexcept>

namespace lectern::core {

class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0) {
        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4;
        }
        
        m_workers.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }
    
    /**
     * Destructor - runs the jobs still queued, then joins the workers
     */
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }
        
        m_condition.notify_all();
        
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
    
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    
    /**
     * Queue a job; exceptions it throws are logged
     * @throws std::runtime_error once the pool is shutting down
     */
    void post(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            
            if (m_stop) {
                throw std::runtime_error("Cannot post to stopped ThreadPool");
            }
            
            m_jobs.push(std::move(job));
        }
        
        m_condition.notify_one();
    }
    
    /**
     * Block until the queue is empty and no job is running.
     * Must not be called from a worker of this pool.
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_jobs.empty() && m_running == 0;
        });
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;
            
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                m_condition.wait(lock, [this] {
                    return m_stop || !m_jobs.empty();
                });
                
                if (m_stop && m_jobs.empty()) {
                    return;
                }
                
                job = std::move(m_jobs.front());
                m_jobs.pop();
                ++m_running;
            }
            
            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR("Background job failed: {}", e.what());
            }
            
            {
                std::lock_guard<std::mutex> lock(m_queueMutex);
                --m_running;
                if (m_jobs.empty() && m_running == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;
    size_t m_running{0};
    bool m_stop{false};
    
    std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;
};

} // namespace lectern::core
