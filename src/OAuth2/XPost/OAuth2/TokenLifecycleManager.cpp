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

#include "TokenLifecycleManager.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "AuthorizationRequest.hpp"
#include "CallbackListener.hpp"
#include "CallbackOutcome.hpp"
#include "OAuth2Errors.hpp"
#include "Pkce.hpp"

namespace XPost::OAuth2 {

std::string_view toString(TokenLifecycleState state) noexcept
{
	switch (state) {
	case TokenLifecycleState::Cached:
		return "Cached";
	case TokenLifecycleState::Refreshing:
		return "Refreshing";
	case TokenLifecycleState::Authorizing:
		return "Authorizing";
	case TokenLifecycleState::Exchanging:
		return "Exchanging";
	case TokenLifecycleState::Done:
		return "Done";
	case TokenLifecycleState::Failed:
		return "Failed";
	}
	return "Unknown";
}

TokenLifecycleManager::TokenLifecycleManager(std::shared_ptr<IOAuth2Client> client,
					     std::shared_ptr<Store::ICredentialStore> store, std::string clientId,
					     OAuth2ProviderSettings providerSettings,
					     std::shared_ptr<OAuth2UserAgent> userAgent,
					     std::shared_ptr<const Logger::ILogger> logger,
					     std::chrono::milliseconds callbackTimeout)
	: client_(client ? std::move(client) : throw std::invalid_argument("ClientIsNullError(TokenLifecycleManager)")),
	  store_(store ? std::move(store) : throw std::invalid_argument("StoreIsNullError(TokenLifecycleManager)")),
	  clientId_(std::move(clientId)),
	  providerSettings_(std::move(providerSettings)),
	  userAgent_(std::move(userAgent)),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(TokenLifecycleManager)")),
	  callbackTimeout_(callbackTimeout)
{
}

TokenLifecycleManager::~TokenLifecycleManager() noexcept = default;

std::string TokenLifecycleManager::getValidToken(bool force)
{
	transition(TokenLifecycleState::Cached);

	try {
		if (force) {
			logger_->info("TokenCacheBypassed");
		} else {
			const std::optional<std::string> accessToken = store_->get(Store::kAccessTokenKey);
			if (accessToken.has_value() && !accessToken->empty() && isCachedTokenValid(*accessToken)) {
				transition(TokenLifecycleState::Done);
				return *accessToken;
			}

			const std::optional<std::string> refreshToken = store_->get(Store::kRefreshTokenKey);
			if (refreshToken.has_value() && !refreshToken->empty()) {
				transition(TokenLifecycleState::Refreshing);
				RefreshResult result = tryRefresh(*refreshToken);
				if (result.succeeded()) {
					persist(*result.tokens);
					transition(TokenLifecycleState::Done);
					return result.tokens->access_token;
				}
				logger_->warn("TokenRefreshIgnored", {{"error", result.errorMessage}});
			}
		}

		std::string accessToken = authorizeInteractively();
		transition(TokenLifecycleState::Done);
		return accessToken;
	} catch (const std::exception &e) {
		transition(TokenLifecycleState::Failed);
		logger_->error("TokenLifecycleFailed", {{"exception", e.what()}});
		throw;
	}
}

RefreshResult TokenLifecycleManager::tryRefresh(const std::string &refreshToken)
{
	try {
		return RefreshResult{.tokens = client_->refresh(refreshToken), .errorCategory = std::nullopt, .errorMessage = {}};
	} catch (const std::exception &e) {
		// Any failure, revoked token or network outage alike, falls back to reauthorization.
		return RefreshResult{
			.tokens = std::nullopt, .errorCategory = RefreshErrorCategory::Ignorable, .errorMessage = e.what()};
	}
}

bool TokenLifecycleManager::isCachedTokenValid(const std::string &accessToken)
{
	try {
		const bool valid = client_->isTokenValid(accessToken);
		logger_->info(valid ? "CachedTokenAccepted" : "CachedTokenRejected");
		return valid;
	} catch (const TransportError &e) {
		logger_->warn("TokenValidityCheckFailed", {{"exception", e.what()}});
		return false;
	}
}

std::string TokenLifecycleManager::authorizeInteractively()
{
	transition(TokenLifecycleState::Authorizing);

	const PkcePair pkce = generatePkcePair();
	const AuthorizationState authorizationState = makeAuthorizationState(providerSettings_);
	const std::string authorizationUrl = buildAuthorizationUrl(providerSettings_.authorization_endpoint, clientId_,
								   authorizationState, pkce.challenge);

	CallbackListener listener(providerSettings_.redirect_host, providerSettings_.redirect_port,
				  providerSettings_.callback_path, authorizationState.state, logger_);
	listener.start();

	if (userAgent_ && userAgent_->onOpenUrl) {
		userAgent_->onOpenUrl(authorizationUrl);
	}

	logger_->info("AuthorizationCallbackWaiting",
		      {{"timeoutMs", std::to_string(callbackTimeout_.count())}});

	CallbackOutcome outcome = [&]() -> CallbackOutcome {
		if (callbackTimeout_ <= std::chrono::milliseconds::zero()) {
			return listener.waitForOutcome();
		}
		std::optional<CallbackOutcome> received = listener.waitForOutcomeFor(callbackTimeout_);
		if (!received.has_value()) {
			throw AuthorizationTimeoutError("AuthorizationTimeoutError(TokenLifecycleManager::authorizeInteractively)");
		}
		return std::move(*received);
	}();

	listener.stop();

	if (std::holds_alternative<StateMismatch>(outcome)) {
		throw ProtocolViolationError("StateMismatchError(TokenLifecycleManager::authorizeInteractively)");
	}

	if (const auto *error = std::get_if<AuthorizationError>(&outcome)) {
		throw ProviderError(fmt::format("ProviderError(TokenLifecycleManager::authorizeInteractively): {}",
						error->reason),
				    error->reason);
	}

	transition(TokenLifecycleState::Exchanging);

	const TokenPair tokens = client_->exchangeCode(std::get<AuthorizationCode>(outcome).code, pkce.verifier,
						       authorizationState.redirect_uri);
	persist(tokens);
	return tokens.access_token;
}

void TokenLifecycleManager::persist(const TokenPair &tokens)
{
	store_->setMany({
		{std::string(Store::kAccessTokenKey), tokens.access_token},
		{std::string(Store::kRefreshTokenKey), tokens.refresh_token},
	});
	logger_->info("TokenPairPersisted");
}

void TokenLifecycleManager::transition(TokenLifecycleState next)
{
	const TokenLifecycleState previous = state_.exchange(next);
	logger_->debug("TokenLifecycleTransition", {{"from", toString(previous)}, {"to", toString(next)}});
}

} // namespace XPost::OAuth2
