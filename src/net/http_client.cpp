#include <openssl/ssl.h>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <chrono>
#include <fstream>
#include <mutex>
#include <vector>
#include <ytupload/http_client.hpp>

#include "utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace ytupload::net {

// =============================================================================
// GZIP/DEFLATE DECOMPRESSION
// =============================================================================

namespace {

constexpr const char *kUserAgent = "ytupload/1.0";

// window_bits: 16 + MAX_WBITS for gzip, -MAX_WBITS for raw deflate
std::optional<std::string> inflate_body(const std::string &compressed,
										int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib (window bits {})", window_bits);
		return std::nullopt;
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string decompressed;
	decompressed.reserve(compressed.size() * 4);

	constexpr size_t kChunkSize = 32768;
	char outbuffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::warn("zlib inflate error: {}", ret);
			return std::nullopt;
		}

		size_t have = kChunkSize - zs.avail_out;
		decompressed.append(outbuffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

std::string decompress_body(const std::string &body,
							const std::string &content_encoding) {
	if (content_encoding.empty() || content_encoding == "identity") {
		return body;
	}

	if (content_encoding == "gzip" || content_encoding == "x-gzip") {
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) {
			spdlog::debug("Decompressed gzip: {} -> {} bytes", body.size(),
						  result->size());
			return *result;
		}
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (content_encoding == "deflate") {
		// Some servers send gzip as deflate
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) return *result;
		if (auto result = inflate_body(body, -MAX_WBITS)) return *result;
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug(
		"Unknown Content-Encoding: {}, returning raw body", content_encoding);
	return body;
}

http::verb to_verb(Method m) {
	switch (m) {
		case Method::post: return http::verb::post;
		case Method::put: return http::verb::put;
		case Method::patch: return http::verb::patch;
		case Method::get:
		default: return http::verb::get;
	}
}

std::error_code map_error(const beast::error_code &ec) {
	if (ec == beast::error::timeout) return make_error_code(errc::timed_out);
	return make_error_code(errc::request_failed);
}

struct Endpoint {
	std::string url;
	std::string host;
	std::string port;
	std::string target;
	bool tls = true;
};

Result<Endpoint> parse_endpoint(const std::string &url_str) {
	auto u_res = boost::urls::parse_absolute_uri(url_str);
	if (u_res.has_error()) return outcome::failure(errc::invalid_url);
	boost::urls::url_view u = u_res.value();

	Endpoint ep;
	ep.url = url_str;
	auto scheme = utils::to_lower(u.scheme());
	if (scheme != "http" && scheme != "https") {
		return outcome::failure(errc::invalid_url);
	}
	ep.tls = scheme == "https";
	ep.host = u.host();
	ep.port = u.port();
	ep.target = u.encoded_path();
	if (u.has_query()) {
		ep.target += "?";
		ep.target += u.encoded_query();
	}
	if (ep.target.empty()) ep.target = "/";
	if (ep.port.empty()) ep.port = ep.tls ? "443" : "80";
	if (ep.host.empty()) return outcome::failure(errc::invalid_url);
	return ep;
}

template <class Fields>
std::map<std::string, std::string> collect_headers(const Fields &fields) {
	std::map<std::string, std::string> out;
	for (auto const &field : fields) {
		out[utils::to_lower(field.name_string())] = std::string(field.value());
	}
	return out;
}

// =============================================================================
// CONNECTION
// =============================================================================
// Plain TCP or TLS stream, chosen from the URL scheme.
// =============================================================================

class Connection {
   public:
	Connection(asio::strand<asio::any_io_executor> strand, ssl::context &ctx,
			   bool tls) {
		if (tls) {
			tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
				strand, ctx);
		} else {
			plain_ = std::make_unique<beast::tcp_stream>(strand);
		}
	}

	[[nodiscard]] bool is_tls() const { return tls_ != nullptr; }

	beast::tcp_stream &lowest() {
		return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
	}

	beast::ssl_stream<beast::tcp_stream> &tls() { return *tls_; }

	// Set SNI and enable hostname verification
	bool prepare_tls(const std::string &host) {
		if (!tls_) return true;
		if (!SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str())) {
			return false;
		}
		return SSL_set1_host(tls_->native_handle(), host.c_str()) == 1;
	}

	template <typename F>
	void visit(F &&f) {
		if (tls_) {
			f(*tls_);
		} else {
			f(*plain_);
		}
	}

   private:
	std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
	std::unique_ptr<beast::tcp_stream> plain_;
};

class IActiveSession {
   public:
	virtual ~IActiveSession() = default;
	virtual void cancel() = 0;
};

}  // namespace

std::string_view to_string(Method m) {
	switch (m) {
		case Method::post: return "POST";
		case Method::put: return "PUT";
		case Method::patch: return "PATCH";
		case Method::get:
		default: return "GET";
	}
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
	auto it = headers.find(utils::to_lower(name));
	if (it == headers.end()) return std::nullopt;
	return it->second;
}

struct HttpClient::Impl {
	asio::any_io_executor ex;
	ssl::context ssl_ctx;

	std::mutex sessions_mutex_;
	std::vector<std::weak_ptr<IActiveSession>> active_sessions_;

	explicit Impl(asio::any_io_executor e)
		: ex(std::move(e)), ssl_ctx(ssl::context::tls_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	void register_session(std::weak_ptr<IActiveSession> session) {
		std::lock_guard lock(sessions_mutex_);
		active_sessions_.erase(
			std::remove_if(active_sessions_.begin(), active_sessions_.end(),
						   [](const auto &wp) { return wp.expired(); }),
			active_sessions_.end());
		active_sessions_.push_back(std::move(session));
	}

	void shutdown() {
		std::lock_guard lock(sessions_mutex_);
		for (auto &wp : active_sessions_) {
			if (auto sp = wp.lock()) { sp->cancel(); }
		}
		active_sessions_.clear();
	}
};

// =============================================================================
// REQUEST SESSION
// =============================================================================
// resolve -> connect -> [handshake] -> write -> read -> [shutdown]
// =============================================================================

class RequestSession : public IActiveSession,
					   public std::enable_shared_from_this<RequestSession> {
   public:
	using CompletionExecutor = Transport::CompletionExecutor;

	RequestSession(const asio::any_io_executor &ex, ssl::context &ctx,
				   asio::any_completion_handler<void(Result<HttpResponse>)> cb,
				   CompletionExecutor handler_ex)
		: strand_(asio::make_strand(ex)),
		  ctx_(ctx),
		  resolver_(strand_),
		  cb_(std::move(cb)),
		  handler_ex_(std::move(handler_ex)) {}

	void cancel() override {
		resolver_.cancel();
		if (conn_) conn_->lowest().cancel();
	}

	void run(HttpRequest request) {
		auto ep = parse_endpoint(request.url);
		if (ep.has_error()) { return post_result(ep.error()); }
		ep_ = std::move(ep).value();
		timeout_ = request.timeout;

		req_.version(11);
		req_.method(to_verb(request.method));
		req_.target(ep_.target);
		req_.set(http::field::host, ep_.host);
		req_.set(http::field::user_agent, kUserAgent);
		req_.set(http::field::accept_encoding, "gzip, deflate");
		for (const auto &[key, value] : request.headers) {
			req_.set(key, value);
		}
		req_.body() = std::move(request.body);
		// PUT/POST/PATCH always carry Content-Length, even when empty
		if (request.method != Method::get || !req_.body().empty()) {
			req_.prepare_payload();
		}

		conn_ = std::make_unique<Connection>(strand_, ctx_, ep_.tls);
		if (!conn_->prepare_tls(ep_.host)) {
			return post_result(make_error_code(errc::request_failed));
		}

		spdlog::debug("{} {}", to_string(request.method), ep_.url);
		resolver_.async_resolve(
			ep_.host, ep_.port,
			beast::bind_front_handler(
				&RequestSession::on_resolve, shared_from_this()));
	}

   private:
	asio::strand<asio::any_io_executor> strand_;
	ssl::context &ctx_;
	tcp::resolver resolver_;
	std::unique_ptr<Connection> conn_;
	asio::any_completion_handler<void(Result<HttpResponse>)> cb_;
	CompletionExecutor handler_ex_;
	Endpoint ep_;
	std::chrono::seconds timeout_{30};
	beast::flat_buffer buf_;
	http::request<http::string_body> req_;
	http::response<http::string_body> res_;

	void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
		if (ec) return fail(ec, "resolve");

		conn_->lowest().expires_after(timeout_);
		conn_->lowest().async_connect(
			results, beast::bind_front_handler(
						 &RequestSession::on_connect, shared_from_this()));
	}

	void on_connect(beast::error_code ec, tcp::endpoint /*unused*/) {
		if (ec) return fail(ec, "connect");

		if (!conn_->is_tls()) return do_write();

		conn_->tls().async_handshake(
			ssl::stream_base::client,
			beast::bind_front_handler(
				&RequestSession::on_handshake, shared_from_this()));
	}

	void on_handshake(beast::error_code ec) {
		if (ec) return fail(ec, "handshake");
		do_write();
	}

	void do_write() {
		conn_->lowest().expires_after(timeout_);
		conn_->visit([this](auto &stream) {
			http::async_write(
				stream, req_,
				beast::bind_front_handler(
					&RequestSession::on_write, shared_from_this()));
		});
	}

	void on_write(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "write");

		conn_->visit([this](auto &stream) {
			http::async_read(stream, buf_, res_,
							 beast::bind_front_handler(
								 &RequestSession::on_read, shared_from_this()));
		});
	}

	void on_read(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "read");

		if (!conn_->is_tls()) {
			beast::error_code ignored;
			conn_->lowest().socket().shutdown(tcp::socket::shutdown_both,
											  ignored);
			return finish();
		}

		// Graceful close - set short timeout
		conn_->lowest().expires_after(std::chrono::seconds(2));
		conn_->tls().async_shutdown(beast::bind_front_handler(
			&RequestSession::on_shutdown, shared_from_this()));
	}

	void on_shutdown(beast::error_code /*ec*/) {
		// Shutdown errors (eof, timeout) don't matter, the body is complete
		finish();
	}

	void finish() {
		std::string content_encoding;
		auto encoding_it = res_.find(http::field::content_encoding);
		if (encoding_it != res_.end()) {
			content_encoding = utils::to_lower(encoding_it->value());
		}

		HttpResponse response;
		response.status_code = static_cast<int>(res_.result_int());
		response.body = decompress_body(res_.body(), content_encoding);
		response.headers = collect_headers(res_);
		spdlog::debug("{} -> HTTP {}", ep_.url, response.status_code);
		post_result(std::move(response));
	}

	void fail(beast::error_code ec, const char *what) {
		spdlog::debug("Request to {} failed in {}: {}", ep_.host, what,
					  ec.message());
		post_result(map_error(ec));
	}

	void post_result(Result<HttpResponse> res) {
		asio::dispatch(
			handler_ex_, [cb = std::move(cb_), res = std::move(res)]() mutable {
				cb(std::move(res));
			});
	}
};

// =============================================================================
// DOWNLOAD SESSION
// =============================================================================
// Streams a response body to disk through a fixed-size buffer so memory use
// stays bounded regardless of the file size.
// =============================================================================

class DownloadSession : public IActiveSession,
						public std::enable_shared_from_this<DownloadSession> {
   public:
	using CompletionExecutor = Transport::CompletionExecutor;

	static constexpr size_t kReadBufferSize = 256 * 1024;
	static constexpr int kMaxRedirects = 5;
	static constexpr auto kTimeout = std::chrono::seconds(300);

	DownloadSession(
		const asio::any_io_executor &ex, ssl::context &ctx,
		asio::any_completion_handler<void(Result<DownloadStatus>)> cb,
		CompletionExecutor handler_ex,
		Transport::ProgressCallback progress_cb)
		: strand_(asio::make_strand(ex)),
		  ctx_(ctx),
		  resolver_(strand_),
		  cb_(std::move(cb)),
		  handler_ex_(std::move(handler_ex)),
		  progress_cb_(std::move(progress_cb)) {}

	void cancel() override {
		resolver_.cancel();
		if (conn_) conn_->lowest().cancel();
	}

	void run(const std::string &url, std::string output_path) {
		output_path_ = std::move(output_path);
		start(url);
	}

   private:
	asio::strand<asio::any_io_executor> strand_;
	ssl::context &ctx_;
	tcp::resolver resolver_;
	std::unique_ptr<Connection> conn_;
	asio::any_completion_handler<void(Result<DownloadStatus>)> cb_;
	CompletionExecutor handler_ex_;
	Transport::ProgressCallback progress_cb_;

	std::string output_path_;
	std::ofstream outfile_;
	Endpoint ep_;
	int redirects_ = 0;

	http::request<http::empty_body> req_;
	std::optional<http::response_parser<http::buffer_body>> parser_;
	beast::flat_buffer buffer_;
	std::vector<char> buf_{std::vector<char>(kReadBufferSize)};

	DownloadStatus status_;

	void start(const std::string &url) {
		auto ep = parse_endpoint(url);
		if (ep.has_error()) return post_result(ep.error());
		ep_ = std::move(ep).value();

		conn_ = std::make_unique<Connection>(strand_, ctx_, ep_.tls);
		if (!conn_->prepare_tls(ep_.host)) {
			return post_result(make_error_code(errc::request_failed));
		}

		parser_.emplace();
		parser_->body_limit(boost::none);
		buffer_.clear();

		spdlog::debug("GET {}", ep_.url);
		resolver_.async_resolve(
			ep_.host, ep_.port,
			beast::bind_front_handler(
				&DownloadSession::on_resolve, shared_from_this()));
	}

	void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
		if (ec) return fail(ec, "resolve");

		conn_->lowest().expires_after(kTimeout);
		conn_->lowest().async_connect(
			results, beast::bind_front_handler(
						 &DownloadSession::on_connect, shared_from_this()));
	}

	void on_connect(beast::error_code ec, tcp::endpoint) {
		if (ec) return fail(ec, "connect");

		if (!conn_->is_tls()) return do_write();

		conn_->tls().async_handshake(
			ssl::stream_base::client,
			beast::bind_front_handler(
				&DownloadSession::on_handshake, shared_from_this()));
	}

	void on_handshake(beast::error_code ec) {
		if (ec) return fail(ec, "handshake");
		do_write();
	}

	void do_write() {
		req_ = {};
		req_.version(11);
		req_.method(http::verb::get);
		req_.target(ep_.target);
		req_.set(http::field::host, ep_.host);
		req_.set(http::field::user_agent, kUserAgent);
		req_.set(http::field::accept, "*/*");
		req_.set(http::field::connection, "close");

		conn_->lowest().expires_after(kTimeout);
		conn_->visit([this](auto &stream) {
			http::async_write(
				stream, req_,
				beast::bind_front_handler(
					&DownloadSession::on_write, shared_from_this()));
		});
	}

	void on_write(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "write");

		conn_->visit([this](auto &stream) {
			http::async_read_header(
				stream, buffer_, *parser_,
				beast::bind_front_handler(
					&DownloadSession::on_read_header, shared_from_this()));
		});
	}

	void on_read_header(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "read_header");

		const auto &res = parser_->get();
		int status = static_cast<int>(res.result_int());

		if (status >= 300 && status < 400) {
			auto loc = res.find(http::field::location);
			if (loc != res.end() && redirects_ < kMaxRedirects) {
				++redirects_;
				auto next = resolve_location(std::string(loc->value()));
				if (next.has_error()) return post_result(next.error());
				spdlog::debug("Redirect {} -> {}", status, next.value());
				conn_->lowest().close();
				return start(next.value());
			}
		}

		status_.status_code = status;
		if (status < 200 || status >= 300) {
			spdlog::debug("Download of {} returned HTTP {}", ep_.url, status);
			conn_->lowest().close();
			return post_result(status_);
		}

		auto cl = res.find(http::field::content_length);
		if (cl != res.end()) {
			auto len = utils::to_u64(cl->value());
			if (len) status_.content_length = len.value();
		}

		outfile_.open(output_path_, std::ios::binary | std::ios::trunc);
		if (!outfile_.is_open()) {
			conn_->lowest().close();
			return post_result(make_error_code(errc::file_open_failed));
		}

		read_body();
	}

	Result<std::string> resolve_location(const std::string &location) {
		auto base = boost::urls::parse_absolute_uri(ep_.url);
		auto ref = boost::urls::parse_uri_reference(location);
		if (base.has_error() || ref.has_error()) {
			return outcome::failure(errc::invalid_url);
		}
		boost::urls::url dest;
		auto r = boost::urls::resolve(base.value(), ref.value(), dest);
		if (r.has_error()) return outcome::failure(errc::invalid_url);
		return std::string(dest.buffer());
	}

	void read_body() {
		if (parser_->is_done()) return on_finish();

		conn_->lowest().expires_after(kTimeout);
		parser_->get().body().data = buf_.data();
		parser_->get().body().size = buf_.size();

		conn_->visit([this](auto &stream) {
			http::async_read(
				stream, buffer_, *parser_,
				beast::bind_front_handler(
					&DownloadSession::on_read_body, shared_from_this()));
		});
	}

	void on_read_body(beast::error_code ec, std::size_t) {
		if (ec == http::error::need_buffer) ec = {};

		// Bytes parsed before a failure are still part of the file
		size_t bytes_read = buf_.size() - parser_->get().body().size;
		if (bytes_read > 0) {
			outfile_.write(buf_.data(), static_cast<std::streamsize>(bytes_read));
			if (!outfile_) {
				conn_->lowest().close();
				return post_result(make_error_code(errc::file_write_failed));
			}
			status_.bytes_written += bytes_read;
			if (progress_cb_) {
				progress_cb_(status_.bytes_written,
							 status_.content_length.value_or(0));
			}
		}
		if (ec) return fail(ec, "read_body");

		read_body();
	}

	void on_finish() {
		outfile_.close();
		conn_->lowest().close();
		if (!outfile_) {
			return post_result(make_error_code(errc::file_write_failed));
		}
		status_.complete = true;
		post_result(status_);
	}

	void fail(beast::error_code ec, const char *what) {
		spdlog::error("Download of {} failed in {}: {}", ep_.url, what,
					  ec.message());
		if (outfile_.is_open()) outfile_.close();
		// A body cut short is still reported so the caller can compare
		// bytes_written against the declared length.
		if (status_.status_code >= 200 && status_.status_code < 300 &&
			ec != beast::error::timeout) {
			return post_result(status_);
		}
		post_result(map_error(ec));
	}

	void post_result(Result<DownloadStatus> res) {
		asio::dispatch(
			handler_ex_, [cb = std::move(cb_), res = std::move(res)]() mutable {
				cb(std::move(res));
			});
	}
};

HttpClient::HttpClient(asio::any_io_executor ex)
	: m_impl(std::make_unique<Impl>(std::move(ex))) {}

HttpClient::~HttpClient() = default;

asio::any_io_executor HttpClient::get_executor() const { return m_impl->ex; }

void HttpClient::shutdown() {
	if (m_impl) { m_impl->shutdown(); }
}

void HttpClient::async_send_impl(
	HttpRequest request,
	asio::any_completion_handler<void(Result<HttpResponse>)> handler,
	CompletionExecutor handler_ex) {
	auto session = std::make_shared<RequestSession>(
		m_impl->ex, m_impl->ssl_ctx, std::move(handler), std::move(handler_ex));
	m_impl->register_session(session);
	session->run(std::move(request));
}

void HttpClient::async_download_file_impl(
	std::string url, std::string output_path, ProgressCallback progress_cb,
	asio::any_completion_handler<void(Result<DownloadStatus>)> handler,
	CompletionExecutor handler_ex) {
	auto session = std::make_shared<DownloadSession>(
		m_impl->ex, m_impl->ssl_ctx, std::move(handler), std::move(handler_ex),
		std::move(progress_cb));
	m_impl->register_session(session);
	session->run(url, std::move(output_path));
}

}  // namespace ytupload::net
