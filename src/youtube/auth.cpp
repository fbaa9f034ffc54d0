#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <boost/url/encode.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <nlohmann/json.hpp>
#include <ytupload/auth.hpp>
#include <ytupload/http_client.hpp>

#include "utils.hpp"

namespace ytupload::youtube {

namespace {

constexpr auto kExpiryMargin = std::chrono::seconds(60);

// application/x-www-form-urlencoded: unreserved characters pass through,
// spaces become '+', everything else is percent-encoded
std::string form_value(std::string_view value) {
	boost::urls::encoding_opts opts;
	opts.space_as_plus = true;
	return boost::urls::encode(value, boost::urls::unreserved_chars, opts);
}

std::string build_form(const Credentials &c) {
	return fmt::format(
		"client_id={}&client_secret={}&refresh_token={}"
		"&grant_type=refresh_token",
		form_value(c.client_id), form_value(c.client_secret),
		form_value(c.refresh_token));
}

}  // namespace

OAuthTokenProvider::OAuthTokenProvider(
	std::shared_ptr<net::Transport> transport, Credentials credentials,
	std::string token_url, std::chrono::seconds timeout)
	: transport_(std::move(transport)),
	  credentials_(std::move(credentials)),
	  token_url_(std::move(token_url)),
	  timeout_(timeout) {}

void OAuthTokenProvider::invalidate() { cached_.reset(); }

Result<std::string> OAuthTokenProvider::access_token(
	asio::yield_context yield) {
	auto now = std::chrono::steady_clock::now();
	if (cached_ && now + kExpiryMargin < cached_->expires_at) {
		return cached_->value;
	}

	if (!credentials_.complete()) {
		spdlog::error(
			"Missing YOUTUBE_CLIENT_ID, YOUTUBE_CLIENT_SECRET or "
			"YOUTUBE_REFRESH_TOKEN");
		return outcome::failure(errc::missing_credentials);
	}

	net::HttpRequest req;
	req.method = net::Method::post;
	req.url = token_url_;
	req.headers = {{"Content-Type", "application/x-www-form-urlencoded"},
				   {"Accept", "application/json"}};
	req.body = build_form(credentials_);
	req.timeout = timeout_;

	auto res = transport_->async_send(std::move(req), yield);
	if (res.has_error()) {
		spdlog::error("Token endpoint unreachable: {}", res.error().message());
		return outcome::failure(errc::token_exchange_failed);
	}

	const auto &resp = res.value();
	auto body = nlohmann::json::parse(resp.body, nullptr, false);

	if (!resp.ok()) {
		std::string error;
		std::string description;
		if (!body.is_discarded()) {
			error = utils::traverse_obj_default<std::string>(body, {"error"}, "");
			description = utils::traverse_obj_default<std::string>(
				body, {"error_description"}, "");
		}
		spdlog::error("Token exchange failed: HTTP {} {} {}", resp.status_code,
					  error, description);

		if (error == "invalid_grant") {
			return outcome::failure(errc::credential_expired);
		}
		if (resp.status_code == 401 || error == "invalid_client" ||
			error == "unauthorized_client") {
			return outcome::failure(errc::credential_rejected);
		}
		return outcome::failure(errc::token_exchange_failed);
	}

	if (body.is_discarded()) {
		spdlog::error("Token endpoint returned invalid JSON");
		return outcome::failure(errc::token_exchange_failed);
	}

	auto token = utils::traverse_obj<std::string>(body, {"access_token"});
	if (!token || token->empty()) {
		spdlog::error("Token response carries no access_token");
		return outcome::failure(errc::token_exchange_failed);
	}
	auto expires_in =
		utils::traverse_obj_default<long long>(body, {"expires_in"}, 3600);

	cached_ = CachedToken{*token, now + std::chrono::seconds(expires_in)};
	spdlog::debug("Obtained access token valid for {}s", expires_in);
	return *token;
}

}  // namespace ytupload::youtube
