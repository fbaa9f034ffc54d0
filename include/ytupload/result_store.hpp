#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ytupload/config.hpp>
#include <ytupload/result.hpp>
#include <ytupload/types.hpp>

namespace ytupload::net {
class Transport;
}  // namespace ytupload::net

namespace ytupload::store {

namespace asio = boost::asio;

inline constexpr std::string_view kReadmeFile = "README.md";
inline constexpr std::string_view kEntryPrefix = "youtube-upload-";
inline constexpr std::string_view kEntrySuffix = ".json";

/// youtube-upload-{unique_id}.json
YTUPLOAD_EXPORT std::string entry_filename(std::string_view unique_id);

struct YTUPLOAD_EXPORT EntryAge {
	std::string filename;
	// Creation time recorded in the entry; empty when unparseable
	std::optional<std::chrono::system_clock::time_point> created;
};

// Keyed store of upload outcomes shared by every run.
// Implementations re-read the backing document before every write and never
// cache it across calls.
class YTUPLOAD_EXPORT ResultStore {
   public:
	virtual ~ResultStore() = default;

	virtual Result<void> put(const std::string &unique_id,
							 const UploadOutcome &result,
							 asio::yield_context yield) = 0;

	virtual Result<UploadOutcome> get(const std::string &unique_id,
									  asio::yield_context yield) = 0;

	virtual Result<std::vector<EntryAge>> list_ages(
		asio::yield_context yield) = 0;

	/// Delete the named entries in one write. Returns how many were still
	/// present; nothing is written when that is zero.
	virtual Result<std::size_t> remove(const std::vector<std::string> &filenames,
									   asio::yield_context yield) = 0;
};

// ResultStore over a single private GitHub Gist, one file per entry
class YTUPLOAD_EXPORT GistResultStore final : public ResultStore {
   public:
	GistResultStore(std::shared_ptr<net::Transport> transport,
					StoreSettings settings, std::string api_url,
					std::chrono::seconds timeout = std::chrono::seconds(30));

	/// Create a private Gist holding only the README placeholder.
	/// Returns the new Gist id.
	static Result<std::string> create(
		net::Transport &transport, const std::string &token,
		const std::string &api_url, asio::yield_context yield,
		std::chrono::seconds timeout = std::chrono::seconds(30));

	Result<void> put(const std::string &unique_id, const UploadOutcome &result,
					 asio::yield_context yield) override;

	Result<UploadOutcome> get(const std::string &unique_id,
							  asio::yield_context yield) override;

	Result<std::vector<EntryAge>> list_ages(asio::yield_context yield) override;

	Result<std::size_t> remove(const std::vector<std::string> &filenames,
							   asio::yield_context yield) override;

   private:
	struct GistFile {
		std::string content;
		bool truncated = false;
		std::string raw_url;
	};
	using FileMap = std::map<std::string, GistFile>;

	Result<FileMap> read_files(asio::yield_context yield);
	Result<void> write_files(const nlohmann::json &files,
							 asio::yield_context yield);
	Result<std::string> full_content(const GistFile &file,
									 asio::yield_context yield);

	std::shared_ptr<net::Transport> transport_;
	StoreSettings settings_;
	std::string gist_url_;
	std::chrono::seconds timeout_;
};

}  // namespace ytupload::store
