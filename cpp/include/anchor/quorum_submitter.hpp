#pragma once

#include "calendar.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anchor
{

    /**
     * Multi-producer single-consumer queue. Producers may outlive the consumer
     * as long as they hold a shared_ptr to the channel.
     */
    template <typename T>
    class ResultChannel
    {
    public:
        void push(T value)
        {
            {
                std::lock_guard lock(mutex_);
                queue_.push_back(std::move(value));
            }
            cv_.notify_one();
        }

        /** Pop the next value, or nullopt once `deadline` passes */
        std::optional<T> receive_until(std::chrono::steady_clock::time_point deadline)
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait_until(lock, deadline, [this]
                                { return !queue_.empty(); }))
                return std::nullopt;
            T value = std::move(queue_.front());
            queue_.pop_front();
            return value;
        }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<T> queue_;
    };

    struct QuorumConfig
    {
        std::vector<std::string> calendar_urls;
        std::size_t m{2};
        std::chrono::milliseconds timeout{std::chrono::seconds(5)};
    };

    /** Calendars used when none are configured */
    std::vector<std::string> default_calendar_urls();

    /**
     * Submits one digest to N calendars at once and accepts the batch when at
     * least M valid proofs arrive before a single shared deadline.
     */
    class QuorumSubmitter
    {
    public:
        explicit QuorumSubmitter(CalendarFactory factory);

        /**
         * Submit root.msg() to every calendar and merge each valid answer into
         * `root`. Returns the number of calendars merged; fails with
         * QuorumNotMet when fewer than cfg.m answered in time. Workers still
         * running at the deadline are left to finish on their own.
         */
        Result<std::size_t> submit(Timestamp &root, const QuorumConfig &cfg);

    private:
        CalendarFactory factory_;
    };

} // namespace anchor
