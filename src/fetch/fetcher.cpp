#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <fstream>
#include <random>
#include <system_error>
#include <utility>
#include <ytupload/fetcher.hpp>
#include <ytupload/http_client.hpp>

namespace ytupload {

namespace fs = std::filesystem;

// =============================================================================
// TempFile
// =============================================================================

TempFile::TempFile(fs::path path) : path_(std::move(path)) {}

TempFile::TempFile(TempFile &&other) noexcept
	: path_(std::exchange(other.path_, {})) {}

TempFile &TempFile::operator=(TempFile &&other) noexcept {
	if (this != &other) {
		remove();
		path_ = std::exchange(other.path_, {});
	}
	return *this;
}

TempFile::~TempFile() { remove(); }

void TempFile::remove() noexcept {
	if (path_.empty()) return;
	std::error_code ec;
	if (fs::remove(path_, ec)) {
		spdlog::debug("Removed temporary file {}", path_.string());
	} else if (ec) {
		spdlog::warn("Failed to remove temporary file {}: {}", path_.string(),
					 ec.message());
	}
	path_.clear();
}

Result<TempFile> TempFile::create(const fs::path &dir,
								  std::string_view suffix) {
	std::error_code ec;
	fs::path base = dir.empty() ? fs::temp_directory_path(ec) : dir;
	if (ec) {
		spdlog::error("No temporary directory available: {}", ec.message());
		return outcome::failure(errc::file_open_failed);
	}

	static thread_local std::mt19937_64 rng{std::random_device{}()};
	for (int attempt = 0; attempt < 8; ++attempt) {
		auto candidate =
			base / fmt::format("ytupload-{:016x}{}", rng(), suffix);
		if (fs::exists(candidate, ec)) continue;

		std::ofstream touch(candidate, std::ios::binary);
		if (!touch.is_open()) {
			spdlog::error("Cannot create {}", candidate.string());
			return outcome::failure(errc::file_open_failed);
		}
		return TempFile(std::move(candidate));
	}
	return outcome::failure(errc::file_open_failed);
}

// =============================================================================
// Fetcher
// =============================================================================

Fetcher::Fetcher(std::shared_ptr<net::Transport> transport,
				 fs::path scratch_dir)
	: transport_(std::move(transport)), scratch_dir_(std::move(scratch_dir)) {}

Result<FetchedFile> Fetcher::fetch(const std::string &url,
								   asio::yield_context yield,
								   const ProgressCallback &progress_cb) {
	auto tmp = TempFile::create(scratch_dir_);
	if (tmp.has_error()) return tmp.error();
	TempFile file = std::move(tmp).value();

	spdlog::info("Downloading video from: {}", url);

	net::Transport::ProgressCallback on_progress;
	if (progress_cb) {
		on_progress = [&progress_cb](std::uint64_t now, std::uint64_t total) {
			TransferProgress p;
			p.bytes_done = now;
			p.bytes_total = total;
			if (total > 0) {
				p.percentage = static_cast<double>(now) /
							   static_cast<double>(total) * 100.0;
			}
			progress_cb("downloading", p);
		};
	}

	auto res = transport_->async_download_file(url, file.path().string(),
											   std::move(on_progress), yield);
	if (res.has_error()) {
		spdlog::error("Failed to download video: {}", res.error().message());
		if (res.error() == errc::file_open_failed ||
			res.error() == errc::file_write_failed) {
			return res.error();
		}
		return outcome::failure(errc::fetch_failed);
	}

	const auto &status = res.value();
	if (status.status_code == 404 || status.status_code == 410) {
		spdlog::error("Source returned HTTP {}", status.status_code);
		return outcome::failure(errc::source_not_found);
	}
	if (status.status_code < 200 || status.status_code >= 300) {
		spdlog::error("Source returned HTTP {}", status.status_code);
		return outcome::failure(errc::source_http_error);
	}

	if (!status.complete ||
		(status.content_length &&
		 status.bytes_written != *status.content_length)) {
		spdlog::error("Source transfer stopped after {} of {} bytes",
					  status.bytes_written,
					  status.content_length
						  ? std::to_string(*status.content_length)
						  : std::string("unknown"));
		return outcome::failure(errc::fetch_interrupted);
	}
	if (status.bytes_written == 0) {
		spdlog::error("Source returned an empty body");
		return outcome::failure(errc::fetch_interrupted);
	}

	spdlog::info("Video downloaded: {:.2f} MB",
				 static_cast<double>(status.bytes_written) / (1024.0 * 1024.0));

	return FetchedFile{std::move(file), status.bytes_written,
					   status.content_length};
}

}  // namespace ytupload
