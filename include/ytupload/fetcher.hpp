#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/spawn.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <ytupload/result.hpp>
#include <ytupload/types.hpp>

namespace ytupload::net {
class Transport;
}  // namespace ytupload::net

namespace ytupload {

namespace asio = boost::asio;

// Scratch file removed when the owner goes out of scope
class YTUPLOAD_EXPORT TempFile {
   public:
	TempFile(const TempFile &) = delete;
	TempFile &operator=(const TempFile &) = delete;
	TempFile(TempFile &&other) noexcept;
	TempFile &operator=(TempFile &&other) noexcept;
	~TempFile();

	/// Reserve a unique path under dir (system temp dir when empty)
	static Result<TempFile> create(const std::filesystem::path &dir = {},
								   std::string_view suffix = ".video");

	[[nodiscard]] const std::filesystem::path &path() const { return path_; }

	/// Remove the file now; safe to call more than once
	void remove() noexcept;

   private:
	explicit TempFile(std::filesystem::path path);

	std::filesystem::path path_;
};

struct YTUPLOAD_EXPORT FetchedFile {
	TempFile file;
	std::uint64_t size = 0;
	std::optional<std::uint64_t> content_length;  // as declared by the source
};

class YTUPLOAD_EXPORT Fetcher {
   public:
	explicit Fetcher(std::shared_ptr<net::Transport> transport,
					 std::filesystem::path scratch_dir = {});

	/// Download url into a scratch file. No retries: every failure is
	/// terminal for the request.
	Result<FetchedFile> fetch(const std::string &url, asio::yield_context yield,
							  const ProgressCallback &progress_cb = {});

   private:
	std::shared_ptr<net::Transport> transport_;
	std::filesystem::path scratch_dir_;
};

}  // namespace ytupload
