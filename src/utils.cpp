#include "utils.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>

namespace ytupload::utils {

namespace {

std::optional<int> field(std::string_view text, size_t pos, size_t len) {
	if (pos + len > text.size()) return std::nullopt;
	auto v = to_number<int>(text.substr(pos, len));
	if (!v) return std::nullopt;
	return v.value();
}

}  // namespace

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
	auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
	return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z",
					   fmt::gmtime(std::chrono::system_clock::to_time_t(secs)));
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(
	std::string_view text) {
	text = trim(text);
	// YYYY-MM-DDTHH:MM:SS
	if (text.size() < 19) return std::nullopt;
	if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
		text[13] != ':' || text[16] != ':') {
		return std::nullopt;
	}

	auto year = field(text, 0, 4);
	auto month = field(text, 5, 2);
	auto day = field(text, 8, 2);
	auto hour = field(text, 11, 2);
	auto minute = field(text, 14, 2);
	auto second = field(text, 17, 2);
	if (!year || !month || !day || !hour || !minute || !second) {
		return std::nullopt;
	}
	if (*hour > 23 || *minute > 59 || *second > 60) {
		return std::nullopt;
	}

	std::string_view rest = text.substr(19);
	if (!rest.empty() && rest.front() == '.') {
		size_t i = 1;
		while (i < rest.size() && rest[i] >= '0' && rest[i] <= '9') ++i;
		if (i == 1) return std::nullopt;
		rest.remove_prefix(i);
	}
	if (!rest.empty() && rest != "Z" && rest != "z" && rest != "+00:00") {
		return std::nullopt;
	}

	const std::chrono::year_month_day date{
		std::chrono::year{*year},
		std::chrono::month{static_cast<unsigned>(*month)},
		std::chrono::day{static_cast<unsigned>(*day)}};
	if (!date.ok()) return std::nullopt;

	auto tp = std::chrono::sys_days{date} + std::chrono::hours(*hour) +
			  std::chrono::minutes(*minute) + std::chrono::seconds(*second);
	return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
		tp);
}

}  // namespace ytupload::utils
