/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * XPost OAuth2 Library
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

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <XPost/Logger/ILogger.hpp>
#include <XPost/Store/ICredentialStore.hpp>

#include "IOAuth2Client.hpp"
#include "OAuth2ClientCredentials.hpp"
#include "TokenPair.hpp"

namespace XPost::OAuth2 {

struct OAuth2UserAgent {
	std::function<void(const std::string &url)> onOpenUrl;
};

enum class TokenLifecycleState { Cached, Refreshing, Authorizing, Exchanging, Done, Failed };

[[nodiscard]]
std::string_view toString(TokenLifecycleState state) noexcept;

// A refresh failure never reaches the caller; it only selects the interactive path.
enum class RefreshErrorCategory { Ignorable };

struct RefreshResult {
	std::optional<TokenPair> tokens;
	std::optional<RefreshErrorCategory> errorCategory;
	std::string errorMessage;

	[[nodiscard]]
	bool succeeded() const noexcept
	{
		return tokens.has_value();
	}
};

/**
 * Produces a usable access token: the cached one if the provider still
 * accepts it, otherwise a refreshed one, otherwise one obtained through the
 * browser consent flow.
 *
 * This is the only writer of access_token and refresh_token in the store.
 * Both are written together and only after a successful grant.
 */
class TokenLifecycleManager {
public:
	TokenLifecycleManager(std::shared_ptr<IOAuth2Client> client, std::shared_ptr<Store::ICredentialStore> store,
			      std::string clientId, OAuth2ProviderSettings providerSettings,
			      std::shared_ptr<OAuth2UserAgent> userAgent, std::shared_ptr<const Logger::ILogger> logger,
			      std::chrono::milliseconds callbackTimeout = std::chrono::milliseconds::zero());

	~TokenLifecycleManager() noexcept;

	TokenLifecycleManager(const TokenLifecycleManager &) = delete;
	TokenLifecycleManager &operator=(const TokenLifecycleManager &) = delete;
	TokenLifecycleManager(TokenLifecycleManager &&) = delete;
	TokenLifecycleManager &operator=(TokenLifecycleManager &&) = delete;

	/**
	 * Runs the cache, refresh, reauthorize sequence.
	 *
	 * @param force Skip the cache and the refresh token and go straight to the browser.
	 * @throws ProtocolViolationError The redirect carried the wrong state.
	 * @throws ProviderError The provider redirected back with an error.
	 * @throws TransportError The code exchange failed.
	 * @throws ListenError The redirect listener could not bind.
	 * @throws AuthorizationTimeoutError A callback timeout is configured and expired.
	 */
	[[nodiscard]]
	std::string getValidToken(bool force = false);

	[[nodiscard]]
	RefreshResult tryRefresh(const std::string &refreshToken);

	[[nodiscard]]
	TokenLifecycleState state() const noexcept
	{
		return state_.load();
	}

private:
	[[nodiscard]]
	std::string authorizeInteractively();
	[[nodiscard]]
	bool isCachedTokenValid(const std::string &accessToken);
	void persist(const TokenPair &tokens);
	void transition(TokenLifecycleState next);

	const std::shared_ptr<IOAuth2Client> client_;
	const std::shared_ptr<Store::ICredentialStore> store_;
	const std::string clientId_;
	const OAuth2ProviderSettings providerSettings_;
	const std::shared_ptr<OAuth2UserAgent> userAgent_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::chrono::milliseconds callbackTimeout_;

	std::atomic<TokenLifecycleState> state_{TokenLifecycleState::Cached};
};

} // namespace XPost::OAuth2
