#include "prediction_runner.hpp"
#include "../logger/Mylogger.h"
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

namespace Prediction
{
    PendingPrediction::PendingPrediction(std::future<double> future, std::shared_ptr<std::atomic<bool>> cancelled)
        : future_(std::move(future)), cancelled_(std::move(cancelled))
    {
    }

    RunResult PendingPrediction::wait(std::chrono::milliseconds timeout)
    {
        if (!future_.valid())
        {
            return {0.0, "Prediction already consumed", false};
        }

        if (timeout.count() > 0 && future_.wait_for(timeout) != std::future_status::ready)
        {
            cancel();
            return {0.0, "Prediction timed out after " + std::to_string(timeout.count()) + " ms", false};
        }

        try
        {
            return {future_.get(), "", true};
        }
        catch (const std::exception &e)
        {
            return {0.0, e.what(), false};
        }
    }

    void PendingPrediction::cancel()
    {
        cancelled_->store(true);
    }

    PredictionRunner::PredictionRunner(const Predictor &predictor, std::size_t worker_count)
        : predictor_(predictor), stop_thread_(false)
    {
        if (worker_count == 0)
        {
            throw std::invalid_argument("PredictionRunner needs at least one worker");
        }
        MyLogger::info("PredictionRunner starting " + std::to_string(worker_count) + " worker thread(s)");
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers_.emplace_back(&PredictionRunner::process, this);
        }
    }

    PredictionRunner::~PredictionRunner()
    {
        MyLogger::info("Stopping PredictionRunner worker threads");
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_thread_ = true;
        }
        cv_.notify_all();
        for (auto &worker : workers_)
        {
            if (worker.joinable())
                worker.join();
        }

        // Anything still queued never ran; fail it instead of leaving waiters hanging.
        for (auto &task : queue_)
        {
            task.promise.set_exception(std::make_exception_ptr(std::runtime_error("Prediction runner stopped")));
        }
        queue_.clear();
        MyLogger::info("PredictionRunner stopped");
    }

    PendingPrediction PredictionRunner::submit(const FeatureRecord &record)
    {
        auto cancelled = std::make_shared<std::atomic<bool>>(false);
        std::promise<double> promise;
        auto future = promise.get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_thread_)
            {
                promise.set_exception(std::make_exception_ptr(std::runtime_error("Prediction runner stopped")));
            }
            else
            {
                queue_.push_back(Task{record, std::move(promise), cancelled});
            }
        }
        cv_.notify_one();
        return PendingPrediction(std::move(future), std::move(cancelled));
    }

    void PredictionRunner::process()
    {
        while (true)
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this]
                     { return stop_thread_ || !queue_.empty(); });

            if (stop_thread_)
                break;

            Task task = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();

            if (task.cancelled->load())
            {
                MyLogger::debug("Skipping cancelled prediction");
                task.promise.set_exception(std::make_exception_ptr(std::runtime_error("Prediction cancelled")));
                continue;
            }

            try
            {
                double value = predictor_.run(task.record);
                if (!std::isfinite(value))
                {
                    throw std::runtime_error("Predictor returned a non-finite value");
                }
                task.promise.set_value(value);
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Predictor failed: " + std::string(e.what()));
                task.promise.set_exception(std::current_exception());
            }
        }
    }
}
