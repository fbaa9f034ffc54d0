#pragma once

#include <ytupload/ytupload_export.h>

#include <boost/asio/spawn.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <ytupload/result.hpp>
#include <ytupload/types.hpp>

namespace ytupload::net {
class Transport;
}  // namespace ytupload::net

namespace ytupload {

namespace asio = boost::asio;

// Posts the outcome to a caller supplied webhook. One attempt only.
class YTUPLOAD_EXPORT Notifier {
   public:
	explicit Notifier(std::shared_ptr<net::Transport> transport,
					  std::chrono::seconds timeout = std::chrono::seconds(10));

	Result<void> notify(const std::string &callback_url,
						const UploadOutcome &result, asio::yield_context yield);

   private:
	std::shared_ptr<net::Transport> transport_;
	std::chrono::seconds timeout_;
};

}  // namespace ytupload
