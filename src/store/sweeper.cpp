#include <spdlog/spdlog.h>

#include <string>
#include <vector>
#include <ytupload/result_store.hpp>
#include <ytupload/sweeper.hpp>

namespace ytupload::store {

Sweeper::Sweeper(ResultStore &store, std::chrono::seconds retention)
	: store_(store), retention_(retention) {}

Result<SweepReport> Sweeper::sweep(std::chrono::system_clock::time_point now,
								   asio::yield_context yield) {
	auto ages = store_.list_ages(yield);
	if (ages.has_error()) return ages.error();

	SweepReport report;
	std::vector<std::string> stale;
	for (const auto &entry : ages.value()) {
		++report.scanned;
		if (!entry.created) {
			spdlog::warn("Keeping {}: no readable timestamp", entry.filename);
			++report.skipped;
			continue;
		}
		if (now - *entry.created > retention_) {
			spdlog::debug("{} is past retention", entry.filename);
			stale.push_back(entry.filename);
		}
	}

	if (stale.empty()) {
		spdlog::info("No results older than {} h", retention_.count() / 3600);
		return report;
	}

	auto removed = store_.remove(stale, yield);
	if (removed.has_error()) return removed.error();

	report.deleted = removed.value();
	spdlog::info("Deleted {} old result(s)", report.deleted);
	return report;
}

}  // namespace ytupload::store
