#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace matchcast {

// ============================================================================
// Job Scheduler (periodic background work on one io_context thread)
// ============================================================================
// Each job re-arms its own steady_timer after it finishes, so a slow run
// delays the next one instead of overlapping it. A job that throws is
// counted and logged; it stays scheduled.

class JobScheduler {
public:
    using Job = std::function<void()>;

    JobScheduler()
        : work_(boost::asio::make_work_guard(ioc_)), running_(false) {}

    ~JobScheduler() {
        stop();
    }

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    // Must be called before start()
    void schedule(const std::string& name, std::chrono::milliseconds interval, Job job) {
        auto entry = std::make_unique<Entry>(ioc_);
        entry->name = name;
        entry->interval = interval;
        entry->job = std::move(job);
        entries_.push_back(std::move(entry));
    }

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        for (auto& entry : entries_) {
            arm(*entry);
        }
        thread_ = std::thread([this]() { ioc_.run(); });
        std::cout << "Job scheduler started with " << entries_.size() << " jobs" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        work_.reset();
        ioc_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Runs a job once on the scheduler thread, outside its timer
    bool trigger(const std::string& name) {
        for (auto& entry : entries_) {
            if (entry->name == name) {
                Entry* e = entry.get();
                boost::asio::post(ioc_, [this, e]() { run(*e); });
                return true;
            }
        }
        return false;
    }

    uint64_t runs(const std::string& name) const {
        const Entry* e = find(name);
        return e != nullptr ? e->runs.load(std::memory_order_acquire) : 0;
    }

    uint64_t failures(const std::string& name) const {
        const Entry* e = find(name);
        return e != nullptr ? e->failures.load(std::memory_order_acquire) : 0;
    }

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        explicit Entry(boost::asio::io_context& ioc) : timer(ioc), runs(0), failures(0) {}

        std::string name;
        std::chrono::milliseconds interval{0};
        Job job;
        boost::asio::steady_timer timer;
        std::atomic<uint64_t> runs;
        std::atomic<uint64_t> failures;
    };

    void arm(Entry& e) {
        e.timer.expires_after(e.interval);
        e.timer.async_wait([this, &e](const boost::system::error_code& ec) {
            if (ec || !running_.load(std::memory_order_acquire)) {
                return;
            }
            run(e);
            arm(e);
        });
    }

    void run(Entry& e) {
        try {
            e.job();
        } catch (const std::exception& ex) {
            e.failures.fetch_add(1, std::memory_order_acq_rel);
            std::cerr << "job " << e.name << " failed: " << ex.what() << "\n";
        }
        e.runs.fetch_add(1, std::memory_order_acq_rel);
    }

    const Entry* find(const std::string& name) const {
        for (const auto& entry : entries_) {
            if (entry->name == name) {
                return entry.get();
            }
        }
        return nullptr;
    }

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::vector<std::unique_ptr<Entry>> entries_;
    std::atomic<bool> running_;
    std::thread thread_;
};

} // namespace matchcast
