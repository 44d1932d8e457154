/*
 * XPost CLI
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <QCoreApplication>

#include <curl/curl.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <XPost/Cli/AppConfig.hpp>
#include <XPost/Cli/BrowserLauncher.hpp>
#include <XPost/Cli/CliApp.hpp>
#include <XPost/Cli/CliOptions.hpp>
#include <XPost/Logger/PrintLogger.hpp>
#include <XPost/OAuth2/XOAuth2Client.hpp>
#include <XPost/Store/JsonCredentialStore.hpp>
#include <XPost/XApi/XApiClient.hpp>

using namespace XPost;

namespace {

class CurlGlobal {
public:
	CurlGlobal()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw std::runtime_error("CurlGlobalInitError(main)");
		}
	}
	~CurlGlobal() noexcept { curl_global_cleanup(); }

	CurlGlobal(const CurlGlobal &) = delete;
	CurlGlobal &operator=(const CurlGlobal &) = delete;
};

std::string readLineFromStdin(const std::string &prompt)
{
	std::cout << prompt << std::flush;
	std::string line;
	std::getline(std::cin, line);
	return line;
}

} // anonymous namespace

int main(int argc, char **argv)
try {
	// The redirect listener runs a Qt event loop on its own thread.
	QCoreApplication app(argc, argv);

	const std::string_view programName = "x-post";
	const std::vector<std::string_view> args(argv + 1, argv + argc);

	Cli::CliOptions options;
	try {
		options = Cli::parseCliOptions(args);
	} catch (const Cli::CliUsageError &e) {
		fmt::print(std::cerr, "{}{}: error: {}\n", Cli::usageText(programName), programName, e.what());
		return 2;
	}

	if (options.help) {
		std::cout << Cli::usageText(programName);
		return 0;
	}

	const auto bootstrapLogger = std::make_shared<Logger::PrintLogger>(Logger::ILogger::LogLevel::Warn);
	const Cli::AppConfig config = Cli::AppConfig::load(Cli::AppConfig::defaultPath(), *bootstrapLogger);

	const std::optional<Logger::ILogger::LogLevel> configuredLevel = Logger::parseLogLevel(config.log_level);
	if (!configuredLevel.has_value()) {
		bootstrapLogger->warn("UnknownLogLevel", {{"logLevel", config.log_level}});
	}
	Logger::ILogger::LogLevel level = configuredLevel.value_or(Logger::ILogger::LogLevel::Warn);
	if (options.verbose) {
		level = Logger::ILogger::LogLevel::Debug;
	}
	const std::shared_ptr<const Logger::ILogger> logger = std::make_shared<Logger::PrintLogger>(level);

	const CurlGlobal curlGlobal;

	auto userAgent = std::make_shared<OAuth2::OAuth2UserAgent>();
	userAgent->onOpenUrl = [logger](const std::string &url) {
		std::cout << "Opening browser for authorization...\n" << url << std::endl;
		if (!Cli::openInBrowser(url, *logger)) {
			std::cerr << "Could not open a browser. Open the URL above manually." << std::endl;
		}
	};

	Cli::CliDependencies dependencies{
		.store = std::make_shared<Store::JsonCredentialStore>(Store::JsonCredentialStore::defaultPath(), logger),
		.makeOAuth2Client =
			[logger](const OAuth2::OAuth2ClientCredentials &credentials,
				 const OAuth2::OAuth2ProviderSettings &providerSettings) {
				return std::make_shared<OAuth2::XOAuth2Client>(credentials, providerSettings, logger);
			},
		.makeXApiClient =
			[logger, apiBaseUrl = config.api_base_url, mediaUploadUrl = config.media_upload_url](
				const std::string &accessToken, const std::optional<XApi::OAuth1Credentials> &oauth1) {
				return std::make_shared<XApi::XApiClient>(accessToken, apiBaseUrl, logger, oauth1,
									  mediaUploadUrl);
			},
		.userAgent = userAgent,
		.prompt = readLineFromStdin,
		.logger = logger,
	};

	Cli::CliApp cliApp(config, std::move(dependencies), std::cin, std::cout, std::cerr);
	return cliApp.run(options);
} catch (const std::exception &e) {
	std::cerr << "Error: " << e.what() << std::endl;
	return 1;
}
