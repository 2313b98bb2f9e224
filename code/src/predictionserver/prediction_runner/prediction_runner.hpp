#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../predictor/predictor.hpp"

namespace Prediction
{
    struct RunResult
    {
        double value;
        std::string err;
        bool success;
    };

    // Handle to one submitted predictor call.
    class PendingPrediction
    {
    public:
        PendingPrediction(std::future<double> future, std::shared_ptr<std::atomic<bool>> cancelled);

        // Blocks until the call finishes. A zero timeout waits indefinitely.
        // On timeout the call is cancelled and a failed result is returned.
        RunResult wait(std::chrono::milliseconds timeout);

        // A call that has not started yet is skipped; a running call finishes
        // but its value is never delivered.
        void cancel();

    private:
        std::future<double> future_;
        std::shared_ptr<std::atomic<bool>> cancelled_;
    };

    // Runs predictor calls on a fixed pool of worker threads so request
    // threads only wait on a future.
    class PredictionRunner
    {
    public:
        PredictionRunner(const Predictor &predictor, std::size_t worker_count);
        ~PredictionRunner();

        PredictionRunner(const PredictionRunner &) = delete;
        PredictionRunner &operator=(const PredictionRunner &) = delete;

        PendingPrediction submit(const FeatureRecord &record);

    private:
        struct Task
        {
            FeatureRecord record;
            std::promise<double> promise;
            std::shared_ptr<std::atomic<bool>> cancelled;
        };

        void process();

        const Predictor &predictor_;
        std::deque<Task> queue_;
        std::mutex queue_mutex_;
        std::condition_variable cv_;
        std::vector<std::thread> workers_;
        bool stop_thread_;
    };
}
