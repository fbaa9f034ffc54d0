#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace ytupload::net {

namespace asio = boost::asio;

enum class Method { get, post, put, patch };

YTUPLOAD_EXPORT std::string_view to_string(Method m);

struct YTUPLOAD_EXPORT HttpRequest {
	Method method = Method::get;
	std::string url;
	std::map<std::string, std::string> headers;
	std::string body;
	std::chrono::seconds timeout{30};
};

struct YTUPLOAD_EXPORT HttpResponse {
	int status_code = 0;
	std::string body;
	// Header names are lower-cased
	std::map<std::string, std::string> headers;

	[[nodiscard]] bool ok() const {
		return status_code >= 200 && status_code < 300;
	}
	[[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

struct YTUPLOAD_EXPORT DownloadStatus {
	int status_code = 0;
	std::uint64_t bytes_written = 0;
	std::optional<std::uint64_t> content_length;
	bool complete = false;	// body read to its end
};

// Asynchronous HTTP seam used by every network-facing component.
// Any HTTP status is a successful result; only transport failures
// (resolve, connect, TLS, timeout, malformed response) are errors.
class YTUPLOAD_EXPORT Transport {
   public:
	virtual ~Transport() = default;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	using CompletionExecutor = asio::any_completion_executor;
	using ProgressCallback =
		std::function<void(std::uint64_t dl_now, std::uint64_t dl_total)>;

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<HttpResponse>))
				  CompletionToken>
	auto async_send(HttpRequest request, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<HttpResponse>)>(
			[this, ex, request = std::move(request)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<HttpResponse>)>{
						std::forward<decltype(handler)>(handler)};

				async_send_impl(std::move(request), std::move(any_handler),
								std::move(handler_ex));
			},
			token);
	}

	// Streams a GET body into output_path. Redirects are followed; a
	// non-2xx final status leaves the file empty and is reported in the
	// returned DownloadStatus.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<DownloadStatus>))
				  CompletionToken>
	auto async_download_file(std::string_view url, std::string_view output_path,
							 ProgressCallback progress_cb,
							 CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<DownloadStatus>)>(
			[this, ex, url_s = std::string(url),
			 output_path_s = std::string(output_path),
			 progress_cb = std::move(progress_cb)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<DownloadStatus>)>{
						std::forward<decltype(handler)>(handler)};

				async_download_file_impl(
					std::move(url_s), std::move(output_path_s),
					std::move(progress_cb), std::move(any_handler),
					std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_send_impl(
		HttpRequest request,
		asio::any_completion_handler<void(Result<HttpResponse>)> handler,
		CompletionExecutor handler_ex) = 0;

	virtual void async_download_file_impl(
		std::string url, std::string output_path, ProgressCallback progress_cb,
		asio::any_completion_handler<void(Result<DownloadStatus>)> handler,
		CompletionExecutor handler_ex) = 0;
};

// Boost.Beast implementation over TCP or TLS
class YTUPLOAD_EXPORT HttpClient final : public Transport {
   public:
	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	~HttpClient() override;

	explicit HttpClient(asio::any_io_executor ex);

	[[nodiscard]] asio::any_io_executor get_executor() const override;

	/// Cancel all in-flight requests
	void shutdown();

	struct Impl;

   protected:
	void async_send_impl(
		HttpRequest request,
		asio::any_completion_handler<void(Result<HttpResponse>)> handler,
		CompletionExecutor handler_ex) override;

	void async_download_file_impl(
		std::string url, std::string output_path, ProgressCallback progress_cb,
		asio::any_completion_handler<void(Result<DownloadStatus>)> handler,
		CompletionExecutor handler_ex) override;

   private:
	std::unique_ptr<Impl> m_impl;
};

}  // namespace ytupload::net
