#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <ytupload/fetcher.hpp>
#include <ytupload/notifier.hpp>
#include <ytupload/orchestrator.hpp>
#include <ytupload/request.hpp>
#include <ytupload/result_store.hpp>

#include "fake_transport.hpp"
#include "utils.hpp"

using namespace ytupload;
using namespace ytupload::testing;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr const char *kSourceUrl = "https://example.com/a.mp4";
constexpr const char *kCallbackUrl = "https://hooks.example.com/done";

const auto kNow = std::chrono::system_clock::time_point(
	std::chrono::seconds(1767225600));	// 2026-01-01T00:00:00Z

class PipelineTest : public ::testing::Test {
   protected:
	void SetUp() override {
		scratch_ = fs::temp_directory_path() /
				   ("ytupload-pipeline-" + std::string(::testing::UnitTest::GetInstance()
														   ->current_test_info()
														   ->name()));
		fs::remove_all(scratch_);
		fs::create_directories(scratch_);

		yt_.install(*transport_);
		gist_.install(*transport_);
		transport_->route(kCallbackUrl, [this](const net::HttpRequest &r) {
			callbacks_.push_back(r);
			return respond(callback_status_);
		});
	}

	void TearDown() override {
		std::error_code ec;
		fs::remove_all(scratch_, ec);
	}

	Config config() const {
		Config c;
		c.credentials = {"client", "secret", "refresh"};
		c.store = {FakeGist::kId, "ghp_test"};
		c.endpoints.token_url = FakeYouTube::kTokenUrl;
		c.endpoints.upload_url = FakeYouTube::kUploadUrl;
		c.endpoints.gist_api_url = FakeGist::kApi;
		c.retry = RetryPolicy::immediate(3);
		c.chunk_size = Config::kChunkGranularity;
		c.scratch_dir = scratch_;
		return c;
	}

	UploadRequest request(std::optional<std::string> unique_id,
						  std::optional<std::string> callback = std::nullopt) {
		UploadRequest r;
		r.video_url = kSourceUrl;
		r.title = "T";
		r.unique_id = std::move(unique_id);
		r.callback_url = std::move(callback);
		return r;
	}

	OrchestrationReport run(Orchestrator &orchestrator,
							const UploadRequest &req) {
		orchestrator.set_clock([] { return kNow; });
		OrchestrationReport report;
		run_coro(ioc_, [&](asio::yield_context yield) {
			report = orchestrator.run(req, yield);
		});
		return report;
	}

	OrchestrationReport run(const UploadRequest &req) {
		Orchestrator orchestrator(transport_, config());
		return run(orchestrator, req);
	}

	nlohmann::json stored(const std::string &id) const {
		return nlohmann::json::parse(
			gist_.files.at(store::entry_filename(id)));
	}

	bool scratch_empty() const { return fs::is_empty(scratch_); }

	asio::io_context ioc_;
	std::shared_ptr<FakeTransport> transport_ =
		std::make_shared<FakeTransport>(ioc_.get_executor());
	FakeYouTube yt_;
	FakeGist gist_;
	std::vector<net::HttpRequest> callbacks_;
	int callback_status_ = 200;
	fs::path scratch_;
};

}  // namespace

// =============================================================================
// Fetcher
// =============================================================================

TEST_F(PipelineTest, FetchWritesSourceToScratchFile) {
	auto blob = make_blob(5000);
	transport_->serve(kSourceUrl, {200, blob, std::nullopt});

	Fetcher fetcher(transport_, scratch_);
	fs::path kept;
	run_coro(ioc_, [&](asio::yield_context yield) {
		auto fetched = fetcher.fetch(kSourceUrl, yield);
		ASSERT_TRUE(fetched.has_value()) << fetched.error().message();
		EXPECT_EQ(fetched.value().size, blob.size());
		EXPECT_EQ(fetched.value().content_length, blob.size());

		kept = fetched.value().file.path();
		std::ifstream in(kept, std::ios::binary);
		std::string data((std::istreambuf_iterator<char>(in)),
						 std::istreambuf_iterator<char>());
		EXPECT_EQ(data, blob);
	});
	// Scratch file goes away with its owner
	EXPECT_FALSE(kept.empty());
	EXPECT_FALSE(fs::exists(kept));
}

TEST_F(PipelineTest, FetchMapsFailures) {
	Fetcher fetcher(transport_, scratch_);

	transport_->serve(kSourceUrl, {404, "", std::nullopt});
	run_coro(ioc_, [&](asio::yield_context yield) {
		EXPECT_EQ(fetcher.fetch(kSourceUrl, yield).error(),
				  errc::source_not_found);
	});

	transport_->serve(kSourceUrl, {503, "", std::nullopt});
	run_coro(ioc_, [&](asio::yield_context yield) {
		EXPECT_EQ(fetcher.fetch(kSourceUrl, yield).error(),
				  errc::source_http_error);
	});

	transport_->serve(kSourceUrl, {200, make_blob(1000), 400});
	run_coro(ioc_, [&](asio::yield_context yield) {
		EXPECT_EQ(fetcher.fetch(kSourceUrl, yield).error(),
				  errc::fetch_interrupted);
	});

	run_coro(ioc_, [&](asio::yield_context yield) {
		EXPECT_EQ(fetcher.fetch("https://unreachable.test/x", yield).error(),
				  errc::fetch_failed);
	});

	EXPECT_TRUE(scratch_empty());
}

// =============================================================================
// Notifier
// =============================================================================

TEST_F(PipelineTest, NotifierPostsOutcomeOnce) {
	Notifier notifier(transport_);
	auto o = UploadOutcome::succeeded(request("u1"), "XYZ", "2026-01-01T00:00:00Z");

	run_coro(ioc_, [&](asio::yield_context yield) {
		EXPECT_TRUE(notifier.notify(kCallbackUrl, o, yield).has_value());
	});
	ASSERT_EQ(callbacks_.size(), 1u);
	EXPECT_EQ(callbacks_[0].method, net::Method::post);
	EXPECT_EQ(callbacks_[0].headers.at("Content-Type"), "application/json");
	EXPECT_EQ(nlohmann::json::parse(callbacks_[0].body), nlohmann::json(o));
	EXPECT_EQ(callbacks_[0].timeout, std::chrono::seconds(10));
}

TEST_F(PipelineTest, NotifierDoesNotRetry) {
	Notifier notifier(transport_);
	callback_status_ = 502;
	auto o = UploadOutcome::failed(request("u1"), "x", "2026-01-01T00:00:00Z");

	run_coro(ioc_, [&](asio::yield_context yield) {
		EXPECT_EQ(notifier.notify(kCallbackUrl, o, yield).error(),
				  errc::notify_failed);
		EXPECT_EQ(notifier.notify("https://unreachable.test/hook", o, yield)
					  .error(),
				  errc::notify_failed);
	});
	EXPECT_EQ(callbacks_.size(), 1u);
}

// =============================================================================
// Orchestrator
// =============================================================================

TEST_F(PipelineTest, SuccessfulRunIsStoredUnderUniqueId) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});

	auto report = run(request("abc-123"));

	const auto &o = report.outcome;
	EXPECT_TRUE(o.success);
	EXPECT_EQ(o.video_id, "XYZ");
	EXPECT_EQ(o.video_url, "https://www.youtube.com/watch?v=XYZ");
	EXPECT_EQ(o.title, "T");
	EXPECT_EQ(o.timestamp, "2026-01-01T00:00:00Z");
	EXPECT_FALSE(report.store_error.has_value());
	EXPECT_FALSE(report.notify_error.has_value());
	ASSERT_TRUE(report.sweep.has_value());

	auto entry = stored("abc-123");
	EXPECT_EQ(entry["success"], true);
	EXPECT_EQ(entry["video_id"], "XYZ");
	EXPECT_EQ(entry["video_url"], "https://www.youtube.com/watch?v=XYZ");
	EXPECT_EQ(entry["title"], "T");
	EXPECT_EQ(entry["unique_id"], "abc-123");

	EXPECT_TRUE(callbacks_.empty());
	EXPECT_TRUE(scratch_empty());
}

TEST_F(PipelineTest, MissingSourceFailsWithoutOpeningSession) {
	transport_->serve(kSourceUrl, {404, "", std::nullopt});

	auto report = run(request("abc-123"));

	EXPECT_FALSE(report.outcome.success);
	ASSERT_TRUE(report.outcome.error.has_value());
	EXPECT_EQ(report.outcome.error->rfind("fetch: ", 0), 0u);
	EXPECT_EQ(yt_.token_requests, 0);
	EXPECT_EQ(yt_.sessions_opened, 0);

	auto entry = stored("abc-123");
	EXPECT_EQ(entry["success"], false);
	EXPECT_EQ(entry["error"], *report.outcome.error);
	EXPECT_FALSE(entry.contains("video_id"));
}

TEST_F(PipelineTest, DeliversToBothChannels) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});

	auto report = run(request("both", kCallbackUrl));

	ASSERT_EQ(callbacks_.size(), 1u);
	EXPECT_EQ(nlohmann::json::parse(callbacks_[0].body), stored("both"));
	EXPECT_EQ(nlohmann::json::parse(callbacks_[0].body),
			  nlohmann::json(report.outcome));
}

TEST_F(PipelineTest, CallbackFailureDoesNotSuppressStore) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});
	callback_status_ = 500;

	auto report = run(request("cb-fails", kCallbackUrl));

	EXPECT_TRUE(report.outcome.success);
	EXPECT_EQ(report.notify_error, make_error_code(errc::notify_failed));
	EXPECT_FALSE(report.store_error.has_value());
	EXPECT_EQ(stored("cb-fails")["success"], true);
}

TEST_F(PipelineTest, StoreFailureDoesNotSuppressCallback) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});
	gist_.fail_writes = true;

	auto report = run(request("store-fails", kCallbackUrl));

	// Uploaded but not recorded
	EXPECT_TRUE(report.outcome.success);
	EXPECT_EQ(report.store_error, make_error_code(errc::store_write_failed));
	EXPECT_EQ(callbacks_.size(), 1u);
}

TEST_F(PipelineTest, UnconfiguredStoreIsReported) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});
	auto cfg = config();
	cfg.store = {};
	Orchestrator orchestrator(transport_, cfg);

	auto report = run(orchestrator, request("no-store", kCallbackUrl));

	EXPECT_TRUE(report.outcome.success);
	EXPECT_EQ(report.store_error, make_error_code(errc::store_not_configured));
	EXPECT_FALSE(report.sweep.has_value());
	EXPECT_EQ(gist_.reads, 0);
	EXPECT_EQ(callbacks_.size(), 1u);
}

TEST_F(PipelineTest, SweepRunsEvenAfterFailure) {
	transport_->serve(kSourceUrl, {500, "", std::nullopt});
	gist_.files[store::entry_filename("ancient")] =
		nlohmann::json{{"success", true},
					   {"title", "old"},
					   {"timestamp", utils::format_iso8601(kNow - 25h)}}
			.dump(2);

	auto report = run(request(std::nullopt));

	EXPECT_FALSE(report.outcome.success);
	ASSERT_TRUE(report.sweep.has_value());
	EXPECT_EQ(report.sweep->deleted, 1u);
	EXPECT_FALSE(gist_.files.count(store::entry_filename("ancient")));
}

TEST_F(PipelineTest, SweepFailureIsReportedNotFatal) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});
	gist_.fail_reads = true;

	auto report = run(request(std::nullopt));

	EXPECT_TRUE(report.outcome.success);
	EXPECT_EQ(report.sweep_error, make_error_code(errc::store_read_failed));
}

TEST_F(PipelineTest, QuotaFailureNamesUploadStage) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});
	yt_.session_responses = {
		{403, R"({"error":{"errors":[{"reason":"quotaExceeded"}]}})"}};

	auto report = run(request("quota"));

	EXPECT_FALSE(report.outcome.success);
	EXPECT_EQ(*report.outcome.error,
			  "upload: " + make_error_code(errc::quota_exceeded).message());
	EXPECT_EQ(stored("quota")["success"], false);
	EXPECT_TRUE(scratch_empty());
}

TEST_F(PipelineTest, CredentialFailureNamesAuthStage) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});
	yt_.token_status = 400;
	yt_.token_error = "invalid_grant";

	auto report = run(request("auth"));

	EXPECT_EQ(*report.outcome.error,
			  "auth: " + make_error_code(errc::credential_expired).message());
}

TEST_F(PipelineTest, MissingCredentialsFailBeforeFetch) {
	auto cfg = config();
	cfg.credentials = {};
	Orchestrator orchestrator(transport_, cfg);

	auto report = run(orchestrator, request("creds"));

	EXPECT_FALSE(report.outcome.success);
	EXPECT_EQ(report.outcome.error->rfind("auth: ", 0), 0u);
	EXPECT_TRUE(transport_->downloads.empty());
	EXPECT_EQ(stored("creds")["success"], false);
}

TEST_F(PipelineTest, RejectedAccessTokenNamesAuthStage) {
	transport_->serve(kSourceUrl, {200, make_blob(1000), std::nullopt});
	yt_.session_responses = {{401, R"({"error":{"code":401}})"}};

	auto report = run(request("scope"));

	EXPECT_EQ(*report.outcome.error,
			  "auth: " + make_error_code(errc::session_unauthorized).message());
	EXPECT_EQ(stored("scope")["error"], *report.outcome.error);
}
