#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace libestim {
namespace utils {

/**
 * IParallelExecutor: schedules independent void() tasks
 *
 * Implementations:
 * - SingleThreadExecutor: runs tasks inline (deterministic, no concurrency)
 * - ThreadPoolExecutor: fixed set of worker threads fed from a queue
 *
 * Exceptions thrown by a task are captured in its future and rethrown by
 * WaitAll().
 */
class IParallelExecutor {
public:
	virtual ~IParallelExecutor() = default;

	virtual std::future<void> Submit(std::function<void()> task) = 0;

	/// Number of tasks that may run at the same time
	virtual size_t Concurrency() const = 0;

	/**
	 * Wait for every future, then rethrow the first captured exception
	 *
	 * All futures are drained before rethrowing so no task outlives the call.
	 */
	virtual void WaitAll(std::vector<std::future<void>> &futures) {
		std::exception_ptr first_error;
		for (auto &f : futures) {
			try {
				f.get();
			} catch (...) {
				if (!first_error) {
					first_error = std::current_exception();
				}
			}
		}
		if (first_error) {
			std::rethrow_exception(first_error);
		}
	}
};

class SingleThreadExecutor : public IParallelExecutor {
public:
	std::future<void> Submit(std::function<void()> task) override {
		std::promise<void> prom;
		auto fut = prom.get_future();
		try {
			task();
			prom.set_value();
		} catch (...) {
			prom.set_exception(std::current_exception());
		}
		return fut;
	}

	size_t Concurrency() const override {
		return 1;
	}
};

/**
 * Fixed-size thread pool
 *
 * n_threads == 0 picks std::thread::hardware_concurrency() (2 if unknown).
 */
class ThreadPoolExecutor : public IParallelExecutor {
public:
	explicit ThreadPoolExecutor(size_t n_threads = 0) : stop_(false) {
		const size_t threads =
		    n_threads > 0 ? n_threads
		                  : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

		try {
			for (size_t i = 0; i < threads; ++i) {
				workers_.emplace_back([this] { WorkerLoop(); });
			}
		} catch (...) {
			Stop();
			throw;
		}
	}

	ThreadPoolExecutor(const ThreadPoolExecutor &) = delete;
	ThreadPoolExecutor &operator=(const ThreadPoolExecutor &) = delete;

	~ThreadPoolExecutor() override {
		Stop();
	}

	std::future<void> Submit(std::function<void()> task) override {
		auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
		auto fut = packaged->get_future();
		{
			std::lock_guard<std::mutex> lock(mutex_);
			if (stop_) {
				throw std::runtime_error("Submit on stopped ThreadPoolExecutor");
			}
			tasks_.emplace([packaged]() { (*packaged)(); });
		}
		condition_.notify_one();
		return fut;
	}

	size_t Concurrency() const override {
		return workers_.size();
	}

private:
	void WorkerLoop() {
		for (;;) {
			std::function<void()> task;
			{
				std::unique_lock<std::mutex> lock(mutex_);
				condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
				if (stop_ && tasks_.empty()) {
					return;
				}
				task = std::move(tasks_.front());
				tasks_.pop();
			}
			task();
		}
	}

	void Stop() {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			stop_ = true;
		}
		condition_.notify_all();
		for (auto &worker : workers_) {
			if (worker.joinable()) {
				worker.join();
			}
		}
	}

	std::vector<std::thread> workers_;
	std::queue<std::function<void()>> tasks_;
	std::mutex mutex_;
	std::condition_variable condition_;
	bool stop_;
};

/**
 * Run body(i) for i in [0, total), split into at most Concurrency() chunks
 *
 * Each index is visited exactly once. Returns after every chunk finished;
 * the first exception thrown by body is rethrown.
 */
template <typename Body>
void ParallelFor(size_t total, IParallelExecutor &executor, Body body) {
	if (total == 0) {
		return;
	}

	const size_t n_tasks = std::max<size_t>(1, executor.Concurrency());
	const size_t chunk_size = (total + n_tasks - 1) / n_tasks;

	std::vector<std::future<void>> futures;
	try {
		for (size_t start = 0; start < total; start += chunk_size) {
			const size_t end = std::min(total, start + chunk_size);
			futures.emplace_back(executor.Submit([=, &body]() {
				for (size_t i = start; i < end; ++i) {
					body(i);
				}
			}));
		}
	} catch (...) {
		// Chunks already queued still reference body
		for (auto &f : futures) {
			f.wait();
		}
		throw;
	}
	executor.WaitAll(futures);
}

/// SingleThreadExecutor for n_threads == 1, otherwise a ThreadPoolExecutor
inline std::unique_ptr<IParallelExecutor> MakeExecutor(size_t n_threads) {
	if (n_threads == 1) {
		return std::make_unique<SingleThreadExecutor>();
	}
	return std::make_unique<ThreadPoolExecutor>(n_threads);
}

} // namespace utils
} // namespace libestim
