#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>
#include <ytupload/result.hpp>

namespace ytupload::store {

namespace asio = boost::asio;

class ResultStore;

struct YTUPLOAD_EXPORT SweepReport {
	std::size_t scanned = 0;
	std::size_t deleted = 0;
	std::size_t skipped = 0;  // entries without a readable timestamp
};

// Deletes result entries older than the retention window in one batched
// write. An entry exactly as old as the window is kept.
class YTUPLOAD_EXPORT Sweeper {
   public:
	Sweeper(ResultStore &store, std::chrono::seconds retention);

	Result<SweepReport> sweep(std::chrono::system_clock::time_point now,
							  asio::yield_context yield);

   private:
	ResultStore &store_;
	std::chrono::seconds retention_;
};

}  // namespace ytupload::store
