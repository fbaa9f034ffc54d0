#pragma once

#include <boost/charconv.hpp>
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ytupload/result.hpp>

namespace ytupload::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<std::uint64_t> to_u64(std::string_view sv) {
	return to_number<std::uint64_t>(sv);
}

// =============================================================================
// String helpers
// =============================================================================

inline std::string_view trim(std::string_view sv) {
	constexpr std::string_view kSpace = " \t\r\n";
	auto first = sv.find_first_not_of(kSpace);
	if (first == std::string_view::npos) return {};
	auto last = sv.find_last_not_of(kSpace);
	return sv.substr(first, last - first + 1);
}

inline std::vector<std::string> split(std::string_view sv, char sep) {
	std::vector<std::string> out;
	size_t start = 0;
	while (true) {
		auto pos = sv.find(sep, start);
		out.emplace_back(sv.substr(start, pos - start));
		if (pos == std::string_view::npos) break;
		start = pos + 1;
	}
	return out;
}

inline std::string to_lower(std::string_view sv) {
	std::string out(sv);
	for (char &c : out) {
		if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
	}
	return out;
}

// =============================================================================
// ISO-8601 timestamps (UTC, second precision)
// =============================================================================

/// 2026-10-19T07:56:00Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Accepts "YYYY-MM-DDTHH:MM:SS" followed by optional fractional seconds and
/// an optional "Z" or "+00:00" suffix.
std::optional<std::chrono::system_clock::time_point> parse_iso8601(
	std::string_view text);

// =============================================================================
// JSON Traversal Utilities
// =============================================================================

class PathElement {
   public:
	PathElement(const char *key) : m_is_index(false), m_key(key), m_index(0) {}
	PathElement(const std::string &key)
		: m_is_index(false), m_key(key), m_index(0) {}
	PathElement(int index) : m_is_index(true), m_index(index) {}

	[[nodiscard]] bool is_index() const { return m_is_index; }
	[[nodiscard]] const std::string &key() const { return m_key; }
	[[nodiscard]] int index() const { return m_index; }

   private:
	bool m_is_index;
	std::string m_key;
	int m_index;
};

namespace detail {

inline const nlohmann::json *step(const nlohmann::json *j,
								  const PathElement &elem) {
	if (!j) return nullptr;

	if (!elem.is_index()) {
		const auto &key = elem.key();
		if (j->is_object() && j->contains(key)) { return &(*j)[key]; }
	} else {
		int idx = elem.index();
		if (j->is_array()) {
			if (idx < 0) { idx = static_cast<int>(j->size()) + idx; }
			if (idx >= 0 && static_cast<size_t>(idx) < j->size()) {
				return &(*j)[static_cast<size_t>(idx)];
			}
		}
	}
	return nullptr;
}

inline const nlohmann::json *traverse(
	const nlohmann::json *j, const std::initializer_list<PathElement> &path) {
	for (const auto &elem : path) {
		j = step(j, elem);
		if (!j) return nullptr;
	}
	return j;
}

}  // namespace detail

/// Traverse a JSON object using a path of keys/indices.
/// Returns std::nullopt if the path doesn't exist or has the wrong type.
///
/// Usage:
///   auto reason = traverse_obj<std::string>(
///       body, {"error", "errors", 0, "reason"});
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j,
							  std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result) return std::nullopt;

	try {
		return result->get<T>();
	} catch (const nlohmann::json::exception &) { return std::nullopt; }
}

template <typename T>
T traverse_obj_default(const nlohmann::json &j,
					   std::initializer_list<PathElement> path, T default_val) {
	auto result = traverse_obj<T>(j, path);
	return result.value_or(std::move(default_val));
}

}  // namespace ytupload::utils
