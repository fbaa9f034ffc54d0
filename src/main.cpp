#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/coroutine/attributes.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include <ytupload/config.hpp>
#include <ytupload/http_client.hpp>
#include <ytupload/orchestrator.hpp>
#include <ytupload/request.hpp>
#include <ytupload/result_store.hpp>
#include <ytupload/sweeper.hpp>

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> g_cancelled{false};

// =============================================================================
// Status Output
// =============================================================================

void log_stage(std::string_view stage, std::string_view msg) {
	fmt::println(stderr, "[{}] {}", stage, msg);
}

// Prints "\r[fetch] 42%" whenever the whole percentage changes
class ProgressPrinter {
   public:
	explicit ProgressPrinter(bool quiet) : quiet_(quiet) {}

	void operator()(const std::string &status,
					const ytupload::TransferProgress &p) {
		if (quiet_) return;
		std::string_view stage = status == "uploading" ? "upload" : "fetch";
		int pct = static_cast<int>(p.percentage);
		if (stage == last_stage_ && pct == last_pct_) return;
		if (!last_stage_.empty() && stage != last_stage_) {
			fmt::print(stderr, "\n");
		}
		last_stage_ = std::string(stage);
		last_pct_ = pct;
		if (p.bytes_total > 0) {
			fmt::print(stderr, "\r[{}] {:3d}% of {} bytes", stage, pct,
					   p.bytes_total);
		} else {
			fmt::print(stderr, "\r[{}] {} bytes", stage, p.bytes_done);
		}
	}

	void finish() {
		if (!last_stage_.empty()) fmt::print(stderr, "\n");
		last_stage_.clear();
	}

   private:
	bool quiet_;
	std::string last_stage_;
	int last_pct_ = -1;
};

// =============================================================================
// Request Assembly
// =============================================================================

ytupload::Result<ytupload::TriggerPayload> read_payload(
	const po::variables_map &vm) {
	ytupload::TriggerPayload payload;

	if (vm.count("payload")) {
		const auto path = vm["payload"].as<std::string>();
		std::ifstream in(path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::error("Cannot open payload file {}", path);
			return ytupload::outcome::failure(ytupload::errc::file_open_failed);
		}
		std::stringstream ss;
		ss << in.rdbuf();
		auto parsed = ytupload::parse_trigger_payload(ss.str());
		if (parsed.has_error()) return parsed.error();
		payload = std::move(parsed).value();
	}

	// Explicit options win over the payload file
	auto take = [&vm](const char *name, std::string &field) {
		if (vm.count(name)) field = vm[name].as<std::string>();
	};
	take("video-url", payload.video_url);
	take("title", payload.title);
	take("description", payload.description);
	take("category-id", payload.category_id);
	take("privacy", payload.privacy);
	take("unique-id", payload.unique_id);
	take("callback-url", payload.callback_url);
	if (vm.count("tags")) {
		payload.tags = ytupload::parse_tags(vm["tags"].as<std::string>());
	}
	return payload;
}

void print_outcome(const ytupload::UploadOutcome &o) {
	nlohmann::json j = o;
	if (o.success) {
		std::cout << j.dump(2) << "\n";
	} else {
		std::cerr << j.dump(2) << "\n";
	}
}

// =============================================================================
// Commands (run inside the coroutine)
// =============================================================================

int run_upload(const std::shared_ptr<ytupload::net::HttpClient> &http,
			   const ytupload::Config &config,
			   const ytupload::UploadRequest &request, bool quiet,
			   asio::yield_context yield) {
	ytupload::Orchestrator orchestrator(http, config);

	log_stage("fetch", fmt::format("Downloading {}", request.video_url));
	ProgressPrinter progress(quiet);
	auto report = orchestrator.run(
		request, yield,
		[&progress](const std::string &status,
					const ytupload::TransferProgress &p) { progress(status, p); });
	progress.finish();

	if (request.callback_url) {
		if (report.notify_error) {
			log_stage("notify", fmt::format("Callback failed: {}",
											report.notify_error->message()));
		} else {
			log_stage("notify", "Callback delivered");
		}
	}
	if (request.unique_id) {
		if (report.store_error) {
			log_stage("store", fmt::format("Result not recorded: {}",
										   report.store_error->message()));
		} else {
			log_stage("store",
					  fmt::format("Saved as {}", ytupload::store::entry_filename(
													 *request.unique_id)));
		}
	}
	if (report.sweep) {
		log_stage("sweep",
				  fmt::format("{} scanned, {} deleted", report.sweep->scanned,
							  report.sweep->deleted));
	}

	if (report.outcome.success) {
		log_stage("upload", fmt::format("Done: {}", *report.outcome.video_url));
	} else {
		log_stage("upload", fmt::format("Failed: {}", *report.outcome.error));
	}
	print_outcome(report.outcome);
	return report.outcome.success ? kExitSuccess : kExitFailure;
}

int run_get(const std::shared_ptr<ytupload::net::HttpClient> &http,
			const ytupload::Config &config, const std::string &unique_id,
			asio::yield_context yield) {
	ytupload::store::GistResultStore store(http, config.store,
										   config.endpoints.gist_api_url,
										   config.request_timeout);
	auto entry = store.get(unique_id, yield);
	if (entry.has_error()) {
		log_stage("store", fmt::format("{}: {}",
									   ytupload::store::entry_filename(unique_id),
									   entry.error().message()));
		return kExitFailure;
	}
	nlohmann::json j = entry.value();
	std::cout << j.dump(2) << "\n";
	return kExitSuccess;
}

int run_sweep(const std::shared_ptr<ytupload::net::HttpClient> &http,
			  const ytupload::Config &config, asio::yield_context yield) {
	ytupload::store::GistResultStore store(http, config.store,
										   config.endpoints.gist_api_url,
										   config.request_timeout);
	ytupload::store::Sweeper sweeper(store, config.retention);
	auto report = sweeper.sweep(std::chrono::system_clock::now(), yield);
	if (report.has_error()) {
		log_stage("sweep", fmt::format("Failed: {}", report.error().message()));
		return kExitFailure;
	}
	log_stage("sweep", fmt::format("{} scanned, {} deleted, {} skipped",
								   report.value().scanned,
								   report.value().deleted,
								   report.value().skipped));
	return kExitSuccess;
}

int run_init_store(const std::shared_ptr<ytupload::net::HttpClient> &http,
				   const ytupload::Config &config, asio::yield_context yield) {
	auto id = ytupload::store::GistResultStore::create(
		*http, config.store.token, config.endpoints.gist_api_url, yield,
		config.request_timeout);
	if (id.has_error()) {
		log_stage("store", fmt::format("Failed to create result gist: {}",
									   id.error().message()));
		return kExitFailure;
	}
	log_stage("store", "Created result gist. Store its id as RESULTS_GIST_ID.");
	std::cout << id.value() << "\n";
	return kExitSuccess;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[ytupload] %v");

		// Parse command line
		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			// Request
			("video-url", po::value<std::string>(), "URL of the video to upload")
			("title", po::value<std::string>(), "Video title")
			("description", po::value<std::string>(), "Video description")
			("tags", po::value<std::string>(), "Comma-separated list of tags")
			("category-id", po::value<std::string>(),
			 "YouTube category ID (default: 22 = People & Blogs)")
			("privacy", po::value<std::string>(),
			 "Privacy status: private, public or unlisted (default: private)")
			("unique-id", po::value<std::string>(),
			 "Key under which the result is stored")
			("callback-url", po::value<std::string>(),
			 "URL that receives the result as a JSON POST")
			("payload", po::value<std::string>(),
			 "JSON file with the request fields")
			// Store maintenance
			("get", po::value<std::string>(), "Print the stored result for an id")
			("sweep", "Delete stored results past retention and exit")
			("init-store", "Create the result gist and print its id")
			// Other
			("quiet,q", "Suppress progress output")
			("verbose,v", "Enable verbose logging");
		// clang-format on
		desc.add(ytupload::config_options());

		po::variables_map vm;
		try {
			po::store(po::parse_command_line(argc, argv, desc), vm);
			po::store(po::parse_environment(ytupload::config_options(),
											ytupload::environment_option_name),
					  vm);
			po::notify(vm);
		} catch (const po::error &e) {
			fmt::println(stderr, "ERROR: {}", e.what());
			return kExitUsage;
		}

		if (vm.count("help")) {
			std::cout << "Usage: ytupload [options]\n" << desc << "\n";
			return kExitSuccess;
		}

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		auto config = ytupload::config_from(vm);
		if (config.has_error()) {
			fmt::println(stderr, "ERROR: Invalid configuration: {}",
						 config.error().message());
			return kExitUsage;
		}

		enum class Command { upload, get, sweep, init_store };
		Command command = Command::upload;
		std::string get_id;
		if (vm.count("init-store")) {
			command = Command::init_store;
		} else if (vm.count("sweep")) {
			command = Command::sweep;
		} else if (vm.count("get")) {
			command = Command::get;
			get_id = vm["get"].as<std::string>();
		}

		if (command == Command::init_store && config.value().store.token.empty()) {
			fmt::println(stderr, "ERROR: GIST_TOKEN or GITHUB_TOKEN is required");
			return kExitUsage;
		}
		if ((command == Command::get || command == Command::sweep) &&
			!config.value().store.configured()) {
			fmt::println(stderr,
						 "ERROR: RESULTS_GIST_ID and GIST_TOKEN are required");
			return kExitUsage;
		}

		ytupload::UploadRequest request;
		if (command == Command::upload) {
			auto payload = read_payload(vm);
			if (payload.has_error()) {
				fmt::println(stderr, "ERROR: Invalid payload: {}",
							 payload.error().message());
				return kExitUsage;
			}
			auto built = ytupload::make_upload_request(payload.value());
			if (built.has_error()) {
				fmt::println(stderr, "ERROR: {}", built.error().message());
				std::cout << "Usage: ytupload --video-url <url> --title <title> "
							 "[options]\n"
						  << desc << "\n";
				return kExitUsage;
			}
			request = std::move(built).value();
		}

		// Setup async context
		asio::io_context ioc;
		auto http =
			std::make_shared<ytupload::net::HttpClient>(ioc.get_executor());

		// Setup signal handling using asio::signal_set
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				g_cancelled.store(true);
				fmt::println(stderr, "\nAborting, received signal {}.", sig);
				http->shutdown();
				ioc.stop();
			}
		});

		int exit_code = kExitFailure;
		const bool quiet = vm.count("quiet") > 0;

		boost::asio::spawn(
			ioc,
			[&](asio::yield_context yield) {
				switch (command) {
					case Command::upload:
						exit_code = run_upload(http, config.value(), request,
											   quiet, yield);
						break;
					case Command::get:
						exit_code = run_get(http, config.value(), get_id, yield);
						break;
					case Command::sweep:
						exit_code = run_sweep(http, config.value(), yield);
						break;
					case Command::init_store:
						exit_code = run_init_store(http, config.value(), yield);
						break;
				}
				// Cancel signal wait so io_context can exit normally
				signals.cancel();
			},
			boost::coroutines::attributes());

		ioc.run();

		return g_cancelled.load() ? kExitFailure : exit_code;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return kExitFailure;
	}
}
