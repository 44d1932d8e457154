/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <XPost/Store/ICredentialStore.hpp>

#include "TemporaryDirectory.hpp"

namespace XPost::Testing {

class InMemoryCredentialStore : public Store::ICredentialStore {
public:
	InMemoryCredentialStore() = default;
	explicit InMemoryCredentialStore(std::map<std::string, std::string> values) : values_(std::move(values)) {}

	std::optional<std::string> get(std::string_view key) const override
	{
		std::scoped_lock lock(mutex_);
		auto it = values_.find(std::string(key));
		if (it == values_.end())
			return std::nullopt;
		return it->second;
	}

	void set(std::string_view key, std::string_view value) override
	{
		std::scoped_lock lock(mutex_);
		values_[std::string(key)] = std::string(value);
		writeCount_++;
	}

	void setMany(const std::map<std::string, std::string> &items) override
	{
		std::scoped_lock lock(mutex_);
		for (const auto &[key, value] : items)
			values_[key] = value;
		writeCount_++;
	}

	void remove(const std::vector<std::string> &keys) override
	{
		std::scoped_lock lock(mutex_);
		for (const auto &key : keys)
			values_.erase(key);
		writeCount_++;
	}

	int writeCount() const
	{
		std::scoped_lock lock(mutex_);
		return writeCount_;
	}

	std::map<std::string, std::string> values() const
	{
		std::scoped_lock lock(mutex_);
		return values_;
	}

private:
	mutable std::mutex mutex_;
	std::map<std::string, std::string> values_;
	int writeCount_ = 0;
};

} // namespace XPost::Testing
