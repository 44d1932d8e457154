/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost Async Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <chrono>
#include <concepts>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace XPost::Async {

template<typename T>
concept OneShotMessage = std::movable<T> && std::is_nothrow_move_constructible_v<T>;

/**
 * @brief A channel that carries exactly one value from one thread to another.
 *
 * The producer calls `send()` once; the consumer blocks in `receive()` until
 * the value is there. Any further `send()` is rejected, so a receiver can
 * never observe more than one value.
 *
 * @warning Single consumer. The value is moved out by the first successful
 * receive; a second receive on the same channel waits forever.
 */
template<OneShotMessage T> class OneShotChannel {
public:
	OneShotChannel() = default;
	~OneShotChannel() = default;

	// Non-copyable and non-movable: the mutex and the waiting consumer need a stable address.
	OneShotChannel(const OneShotChannel &) = delete;
	OneShotChannel &operator=(const OneShotChannel &) = delete;
	OneShotChannel(OneShotChannel &&) = delete;
	OneShotChannel &operator=(OneShotChannel &&) = delete;

	/**
	 * @brief Delivers the value.
	 *
	 * @return `true` if this call delivered the value.
	 * @return `false` if a value was already sent. The argument is dropped.
	 */
	bool send(T value)
	{
		{
			std::scoped_lock lock(mutex_);
			if (sent_)
				return false;
			sent_ = true;
			value_.emplace(std::move(value));
		}
		cv_.notify_one();
		return true;
	}

	[[nodiscard]]
	bool hasSent() const
	{
		std::scoped_lock lock(mutex_);
		return sent_;
	}

	/**
	 * @brief Blocks until the value arrives and returns it.
	 */
	[[nodiscard]]
	T receive()
	{
		std::unique_lock lock(mutex_);
		cv_.wait(lock, [this] { return value_.has_value(); });
		return take();
	}

	/**
	 * @brief Blocks for at most `timeout`.
	 *
	 * @return The value, or `std::nullopt` if nothing was sent in time.
	 */
	template<typename Rep, typename Period>
	[[nodiscard]]
	std::optional<T> receiveFor(std::chrono::duration<Rep, Period> timeout)
	{
		std::unique_lock lock(mutex_);
		if (!cv_.wait_for(lock, timeout, [this] { return value_.has_value(); })) {
			return std::nullopt;
		}
		return take();
	}

private:
	T take()
	{
		T result = std::move(*value_);
		value_.reset();
		return result;
	}

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::optional<T> value_;
	bool sent_ = false;
};

} // namespace XPost::Async
