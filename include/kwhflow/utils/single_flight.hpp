#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace kwhflow::utils {

/**
 * @class SingleFlight
 * @brief Runs a keyed operation at most once at a time and remembers its result.
 *
 * Concurrent callers with the same key wait for the call already in flight and
 * share its result. A successful result is kept, so later callers get it
 * without running the operation again. A failed call is forgotten: every
 * waiter sees the exception and the next caller starts a fresh attempt.
 */
template <typename T>
class SingleFlight {
public:
	T run(const std::string &key, const std::function<T()> &operation) {
		std::shared_future<T> future;
		std::shared_ptr<std::promise<T>> promise;
		{
			std::lock_guard<std::mutex> lock(mutex_);
			auto it = flights_.find(key);
			if (it != flights_.end()) {
				future = it->second;
			} else {
				promise = std::make_shared<std::promise<T>>();
				future = promise->get_future().share();
				flights_.emplace(key, future);
			}
		}

		if (!promise) {
			return future.get();
		}

		try {
			promise->set_value(operation());
		} catch (...) {
			{
				std::lock_guard<std::mutex> lock(mutex_);
				flights_.erase(key);
			}
			promise->set_exception(std::current_exception());
		}
		return future.get();
	}

	bool contains(const std::string &key) const {
		std::lock_guard<std::mutex> lock(mutex_);
		return flights_.find(key) != flights_.end();
	}

	void forget(const std::string &key) {
		std::lock_guard<std::mutex> lock(mutex_);
		flights_.erase(key);
	}

private:
	mutable std::mutex mutex_;
	std::map<std::string, std::shared_future<T>> flights_;
};

/**
 * @class KeyedMutex
 * @brief One mutex per key, created on first use and never released.
 */
class KeyedMutex {
public:
	std::unique_lock<std::mutex> lock(const std::string &key) {
		std::mutex *entry = nullptr;
		{
			std::lock_guard<std::mutex> guard(mutex_);
			auto &slot = mutexes_[key];
			if (!slot) {
				slot = std::make_unique<std::mutex>();
			}
			entry = slot.get();
		}
		return std::unique_lock<std::mutex>(*entry);
	}

private:
	std::mutex mutex_;
	std::map<std::string, std::unique_ptr<std::mutex>> mutexes_;
};

} // namespace kwhflow::utils
