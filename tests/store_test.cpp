#include <gtest/gtest.h>

#include <chrono>
#include <nlohmann/json.hpp>
#include <ytupload/request.hpp>
#include <ytupload/result_store.hpp>
#include <ytupload/sweeper.hpp>

#include "fake_transport.hpp"
#include "utils.hpp"

using namespace ytupload;
using namespace ytupload::testing;
using namespace std::chrono_literals;

namespace {

const auto kNow = std::chrono::system_clock::time_point(
	std::chrono::seconds(1767225600));	// 2026-01-01T00:00:00Z

class StoreTest : public ::testing::Test {
   protected:
	void SetUp() override { gist_.install(*transport_); }

	store::GistResultStore make_store() {
		return store::GistResultStore(transport_,
									  StoreSettings{FakeGist::kId, "ghp_test"},
									  FakeGist::kApi);
	}

	UploadOutcome sample(const std::string &id, bool ok = true) {
		UploadRequest req;
		req.video_url = "https://example.com/a.mp4";
		req.title = "T";
		req.unique_id = id;
		return ok ? UploadOutcome::succeeded(req, "XYZ", "2026-01-01T00:00:00Z")
				  : UploadOutcome::failed(req, "fetch: source not found",
										  "2026-01-01T00:00:00Z");
	}

	// Entry written by some earlier run at the given time
	void seed(const std::string &id, std::chrono::system_clock::time_point at) {
		nlohmann::json j = {{"success", true},
							{"title", "old"},
							{"unique_id", id},
							{"timestamp", utils::format_iso8601(at)}};
		gist_.files[store::entry_filename(id)] = j.dump(2);
	}

	template <typename Fn>
	void run(Fn &&fn) {
		run_coro(ioc_, [&](asio::yield_context yield) { fn(yield); });
	}

	asio::io_context ioc_;
	std::shared_ptr<FakeTransport> transport_ =
		std::make_shared<FakeTransport>(ioc_.get_executor());
	FakeGist gist_;
};

}  // namespace

TEST(EntryFilename, UsesFixedPrefixAndSuffix) {
	EXPECT_EQ(store::entry_filename("abc-123"), "youtube-upload-abc-123.json");
}

// =============================================================================
// GistResultStore
// =============================================================================

TEST_F(StoreTest, PutThenGetReturnsSameDocument) {
	auto store = make_store();
	auto written = sample("abc-123");

	run([&](asio::yield_context yield) {
		ASSERT_TRUE(store.put("abc-123", written, yield).has_value());
		auto back = store.get("abc-123", yield);
		ASSERT_TRUE(back.has_value());
		EXPECT_EQ(nlohmann::json(back.value()), nlohmann::json(written));
	});

	const auto &content = gist_.files.at("youtube-upload-abc-123.json");
	EXPECT_EQ(content, nlohmann::json(written).dump(2));
	EXPECT_EQ(gist_.last_token, "Bearer ghp_test");
	EXPECT_EQ(gist_.writes, 1);
}

TEST_F(StoreTest, PutRereadsAndKeepsOtherEntries) {
	auto store = make_store();
	seed("other", kNow);

	run([&](asio::yield_context yield) {
		ASSERT_TRUE(store.put("a", sample("a"), yield).has_value());
		// Another process adds an entry between our writes
		seed("racer", kNow);
		ASSERT_TRUE(store.put("b", sample("b", false), yield).has_value());
	});

	EXPECT_EQ(gist_.reads, 2);
	EXPECT_EQ(gist_.writes, 2);
	EXPECT_TRUE(gist_.files.count("README.md"));
	EXPECT_TRUE(gist_.files.count("youtube-upload-other.json"));
	EXPECT_TRUE(gist_.files.count("youtube-upload-racer.json"));
	EXPECT_TRUE(gist_.files.count("youtube-upload-a.json"));
	EXPECT_TRUE(gist_.files.count("youtube-upload-b.json"));
}

TEST_F(StoreTest, PutNeverResendsTruncatedFiles) {
	auto store = make_store();
	gist_.files["huge.json"] = std::string(100, 'x');
	gist_.truncated.insert("huge.json");

	run([&](asio::yield_context yield) {
		ASSERT_TRUE(store.put("a", sample("a"), yield).has_value());
	});

	EXPECT_FALSE(gist_.last_patch["files"].contains("huge.json"));
	EXPECT_EQ(gist_.files.at("huge.json"), std::string(100, 'x'));
}

TEST_F(StoreTest, PutOverwritesSameId) {
	auto store = make_store();

	run([&](asio::yield_context yield) {
		ASSERT_TRUE(store.put("a", sample("a", false), yield).has_value());
		ASSERT_TRUE(store.put("a", sample("a", true), yield).has_value());
		auto back = store.get("a", yield);
		ASSERT_TRUE(back.has_value());
		EXPECT_TRUE(back.value().success);
	});
}

TEST_F(StoreTest, GetFollowsRawUrlForTruncatedEntry) {
	auto store = make_store();
	gist_.files[store::entry_filename("big")] =
		nlohmann::json(sample("big")).dump(2);
	gist_.truncated.insert(store::entry_filename("big"));

	run([&](asio::yield_context yield) {
		auto back = store.get("big", yield);
		ASSERT_TRUE(back.has_value()) << back.error().message();
		EXPECT_EQ(back.value().video_id, "XYZ");
	});
	EXPECT_EQ(transport_->count(std::string(FakeGist::kApi) + "/gists/" +
								FakeGist::kId + "/raw/"),
			  1u);
}

TEST_F(StoreTest, GetMissingEntryIsNotFound) {
	auto store = make_store();
	run([&](asio::yield_context yield) {
		EXPECT_EQ(store.get("nope", yield).error(), errc::store_entry_not_found);
	});
}

TEST_F(StoreTest, ReadAndWriteFailuresAreDistinct) {
	auto store = make_store();

	gist_.fail_reads = true;
	run([&](asio::yield_context yield) {
		EXPECT_EQ(store.put("a", sample("a"), yield).error(),
				  errc::store_read_failed);
	});
	EXPECT_EQ(gist_.writes, 0);

	gist_.fail_reads = false;
	gist_.fail_writes = true;
	run([&](asio::yield_context yield) {
		EXPECT_EQ(store.put("a", sample("a"), yield).error(),
				  errc::store_write_failed);
	});
}

TEST_F(StoreTest, ListAgesSkipsReadmeAndFlagsBadTimestamps) {
	auto store = make_store();
	seed("good", kNow - 1h);
	gist_.files["youtube-upload-bad.json"] = "{not json";

	run([&](asio::yield_context yield) {
		auto ages = store.list_ages(yield);
		ASSERT_TRUE(ages.has_value());
		ASSERT_EQ(ages.value().size(), 2u);
		for (const auto &a : ages.value()) {
			if (a.filename == "youtube-upload-good.json") {
				ASSERT_TRUE(a.created.has_value());
				EXPECT_EQ(*a.created, kNow - 1h);
			} else {
				EXPECT_EQ(a.filename, "youtube-upload-bad.json");
				EXPECT_FALSE(a.created.has_value());
			}
		}
	});
}

TEST_F(StoreTest, RemoveBatchesAndSkipsMissing) {
	auto store = make_store();
	seed("a", kNow);
	seed("b", kNow);
	seed("c", kNow);

	run([&](asio::yield_context yield) {
		auto removed = store.remove({"youtube-upload-a.json",
									 "youtube-upload-b.json",
									 "youtube-upload-gone.json"},
									yield);
		ASSERT_TRUE(removed.has_value());
		EXPECT_EQ(removed.value(), 2u);
	});

	EXPECT_EQ(gist_.writes, 1);
	EXPECT_TRUE(gist_.last_patch["files"]["youtube-upload-a.json"].is_null());
	EXPECT_FALSE(gist_.last_patch["files"].contains("youtube-upload-gone.json"));
	EXPECT_TRUE(gist_.files.count("youtube-upload-c.json"));
	EXPECT_FALSE(gist_.files.count("youtube-upload-a.json"));
}

TEST_F(StoreTest, RemovingDeletedEntriesWritesNothing) {
	auto store = make_store();

	run([&](asio::yield_context yield) {
		auto removed = store.remove({"youtube-upload-gone.json"}, yield);
		ASSERT_TRUE(removed.has_value());
		EXPECT_EQ(removed.value(), 0u);
	});
	EXPECT_EQ(gist_.writes, 0);
}

TEST_F(StoreTest, CreateMakesPrivateGistWithReadme) {
	run([&](asio::yield_context yield) {
		auto id = store::GistResultStore::create(*transport_, "ghp_test",
												 FakeGist::kApi, yield);
		ASSERT_TRUE(id.has_value());
		EXPECT_EQ(id.value(), "newgist");
	});
	EXPECT_EQ(gist_.last_patch["public"], false);
	EXPECT_TRUE(gist_.last_patch["files"].contains("README.md"));
}

// =============================================================================
// Sweeper
// =============================================================================

TEST_F(StoreTest, SweepBoundaryIsStrictlyGreaterThan) {
	auto store = make_store();
	seed("exact", kNow - 24h);
	seed("older", kNow - 24h - 1s);
	seed("fresh", kNow - 1h);

	store::Sweeper sweeper(store, 24h);
	run([&](asio::yield_context yield) {
		auto report = sweeper.sweep(kNow, yield);
		ASSERT_TRUE(report.has_value());
		EXPECT_EQ(report.value().scanned, 3u);
		EXPECT_EQ(report.value().deleted, 1u);
	});

	EXPECT_TRUE(gist_.files.count("youtube-upload-exact.json"));
	EXPECT_FALSE(gist_.files.count("youtube-upload-older.json"));
	EXPECT_TRUE(gist_.files.count("youtube-upload-fresh.json"));
	EXPECT_TRUE(gist_.files.count("README.md"));
}

TEST_F(StoreTest, SweepDeletesStaleEntriesInOneWrite) {
	auto store = make_store();
	for (int i = 0; i < 25; ++i) {
		seed("new-" + std::to_string(i), kNow - std::chrono::minutes(i * 30));
	}
	for (int i = 0; i < 5; ++i) {
		seed("old-" + std::to_string(i), kNow - 25h - std::chrono::hours(i));
	}

	store::Sweeper sweeper(store, 24h);
	run([&](asio::yield_context yield) {
		auto report = sweeper.sweep(kNow, yield);
		ASSERT_TRUE(report.has_value());
		EXPECT_EQ(report.value().scanned, 30u);
		EXPECT_EQ(report.value().deleted, 5u);
	});

	EXPECT_EQ(gist_.writes, 1);
	EXPECT_EQ(gist_.files.size(), 26u);	 // 25 entries + README
}

TEST_F(StoreTest, SecondSweepIsNoOp) {
	auto store = make_store();
	seed("old", kNow - 48h);
	seed("new", kNow);

	store::Sweeper sweeper(store, 24h);
	run([&](asio::yield_context yield) {
		ASSERT_EQ(sweeper.sweep(kNow, yield).value().deleted, 1u);
		auto second = sweeper.sweep(kNow, yield);
		ASSERT_TRUE(second.has_value());
		EXPECT_EQ(second.value().deleted, 0u);
	});
	EXPECT_EQ(gist_.writes, 1);
}

TEST_F(StoreTest, SweepKeepsEntriesWithoutTimestamp) {
	auto store = make_store();
	gist_.files["notes.txt"] = "hello";
	seed("old", kNow - 48h);

	store::Sweeper sweeper(store, 24h);
	run([&](asio::yield_context yield) {
		auto report = sweeper.sweep(kNow, yield);
		ASSERT_TRUE(report.has_value());
		EXPECT_EQ(report.value().skipped, 1u);
		EXPECT_EQ(report.value().deleted, 1u);
	});
	EXPECT_TRUE(gist_.files.count("notes.txt"));
}

TEST_F(StoreTest, SweepReportsReadFailure) {
	auto store = make_store();
	gist_.fail_reads = true;

	store::Sweeper sweeper(store, 24h);
	run([&](asio::yield_context yield) {
		EXPECT_EQ(sweeper.sweep(kNow, yield).error(), errc::store_read_failed);
	});
}
