#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>
#include <ytupload/http_client.hpp>
#include <ytupload/notifier.hpp>
#include <ytupload/request.hpp>

namespace ytupload {

Notifier::Notifier(std::shared_ptr<net::Transport> transport,
				   std::chrono::seconds timeout)
	: transport_(std::move(transport)), timeout_(timeout) {}

Result<void> Notifier::notify(const std::string &callback_url,
							  const UploadOutcome &result,
							  asio::yield_context yield) {
	net::HttpRequest req;
	req.method = net::Method::post;
	req.url = callback_url;
	req.headers = {{"Content-Type", "application/json"}};
	req.body = nlohmann::json(result).dump();
	req.timeout = timeout_;

	auto res = transport_->async_send(std::move(req), yield);
	if (res.has_error()) {
		spdlog::warn("Callback to {} failed: {}", callback_url,
					 res.error().message());
		return outcome::failure(errc::notify_failed);
	}
	if (!res.value().ok()) {
		spdlog::warn("Callback to {} returned HTTP {}", callback_url,
					 res.value().status_code);
		return outcome::failure(errc::notify_failed);
	}

	spdlog::debug("Callback delivered to {}", callback_url);
	return outcome::success();
}

}  // namespace ytupload
