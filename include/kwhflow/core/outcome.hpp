#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace kwhflow::core {

/**
 * @brief Failure categories reported by the pipeline stages.
 *
 * All kinds are fatal to the current run. DST drops are not an error kind;
 * they are reported as a count on the resolver result.
 */
enum class ErrorKind {
	DataSource,  // malformed or missing raw import
	Transform,   // unparseable timestamp or column
	Consistency, // energy conservation violated during aggregation
	Store        // the external statistics store rejected a read or write
};

inline const char *errorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::DataSource:
		return "DataSourceError";
	case ErrorKind::Transform:
		return "TransformError";
	case ErrorKind::Consistency:
		return "ConsistencyError";
	case ErrorKind::Store:
		return "StoreError";
	}
	return "UnknownError";
}

struct Error {
	ErrorKind kind = ErrorKind::DataSource;
	std::string message;

	std::string describe() const {
		return std::string(errorKindName(kind)) + ": " + message;
	}
};

/**
 * @class Outcome
 * @brief Value of a pipeline stage or the error that stopped it.
 *
 * Accessing the value of a failed outcome, or the error of a successful one,
 * throws std::logic_error.
 */
template <typename T>
class Outcome {
public:
	using ValueType = T;

	static Outcome success(T value) {
		return Outcome(std::in_place_index<0>, std::move(value));
	}

	static Outcome failure(ErrorKind kind, std::string message) {
		return Outcome(std::in_place_index<1>, Error{kind, std::move(message)});
	}

	static Outcome failure(Error error) {
		return Outcome(std::in_place_index<1>, std::move(error));
	}

	bool ok() const noexcept {
		return state_.index() == 0;
	}

	explicit operator bool() const noexcept {
		return ok();
	}

	const T &value() const & {
		ensureValue();
		return std::get<0>(state_);
	}

	T &value() & {
		ensureValue();
		return std::get<0>(state_);
	}

	T &&value() && {
		ensureValue();
		return std::get<0>(std::move(state_));
	}

	const Error &error() const {
		if (ok()) {
			throw std::logic_error("Outcome holds a value, not an error.");
		}
		return std::get<1>(state_);
	}

	/**
	 * @brief Re-wraps the error of a failed outcome for a different value type.
	 */
	template <typename U>
	Outcome<U> propagate() const {
		return Outcome<U>::failure(error());
	}

private:
	template <std::size_t I, typename Arg>
	Outcome(std::in_place_index_t<I> tag, Arg &&arg) : state_(tag, std::forward<Arg>(arg)) {
	}

	void ensureValue() const {
		if (!ok()) {
			throw std::logic_error("Outcome holds an error: " + std::get<1>(state_).describe());
		}
	}

	std::variant<T, Error> state_;
};

} // namespace kwhflow::core
