#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <ytupload/config.hpp>
#include <ytupload/result.hpp>

namespace ytupload::net {
class Transport;
}  // namespace ytupload::net

namespace ytupload::youtube {

namespace asio = boost::asio;

// Exchanges the refresh token for short-lived access tokens
// (OAuth 2.0 refresh_token grant).
class YTUPLOAD_EXPORT OAuthTokenProvider {
   public:
	OAuthTokenProvider(std::shared_ptr<net::Transport> transport,
					   Credentials credentials, std::string token_url,
					   std::chrono::seconds timeout = std::chrono::seconds(30));

	/// Cached token, refreshed 60 s before it expires.
	/// Errors: missing_credentials, credential_rejected (client id/secret
	/// wrong), credential_expired (refresh token expired or revoked),
	/// token_exchange_failed (anything else).
	Result<std::string> access_token(asio::yield_context yield);

	/// Drop the cached token so the next call performs a fresh exchange
	void invalidate();

   private:
	struct CachedToken {
		std::string value;
		std::chrono::steady_clock::time_point expires_at;
	};

	std::shared_ptr<net::Transport> transport_;
	Credentials credentials_;
	std::string token_url_;
	std::chrono::seconds timeout_;
	std::optional<CachedToken> cached_;
};

}  // namespace ytupload::youtube
