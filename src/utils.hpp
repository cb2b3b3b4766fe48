#pragma once

#include <boost/charconv.hpp>
#include <dlpoll/result.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace dlpoll::utils {

// =============================================================================
// Numeric conversions (boost::charconv, locale independent)
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val{};
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::malformed_output);
}

inline Result<double> to_double(std::string_view sv) {
	return to_number<double>(sv);
}

/// Engine fields print "NA" (or nothing) when a value is unknown.
template <typename T>
std::optional<T> to_optional_number(std::string_view sv) {
	if (sv.empty() || sv == "NA" || sv == "None") return std::nullopt;
	auto res = to_number<T>(sv);
	if (res.has_error()) return std::nullopt;
	return res.value();
}

inline std::string_view trim(std::string_view sv) {
	constexpr std::string_view kSpace = " \t\r\n";
	auto first = sv.find_first_not_of(kSpace);
	if (first == std::string_view::npos) return {};
	auto last = sv.find_last_not_of(kSpace);
	return sv.substr(first, last - first + 1);
}

// =============================================================================
// JSON traversal over engine metadata
// =============================================================================

// A path step: object key or array index.
class PathElement {
   public:
	PathElement(const char *key) : m_is_index(false), m_key(key), m_index(0) {}
	PathElement(std::string key)
		: m_is_index(false), m_key(std::move(key)), m_index(0) {}
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
		if (j->is_object()) {
			auto it = j->find(elem.key());
			if (it != j->end()) return &*it;
		}
		return nullptr;
	}

	if (!j->is_array()) return nullptr;
	int idx = elem.index();
	if (idx < 0) idx = static_cast<int>(j->size()) + idx;
	if (idx < 0 || static_cast<size_t>(idx) >= j->size()) return nullptr;
	return &(*j)[static_cast<size_t>(idx)];
}

inline const nlohmann::json *traverse(
	const nlohmann::json *j, std::initializer_list<PathElement> path) {
	for (const auto &elem : path) {
		j = step(j, elem);
		if (!j) return nullptr;
	}
	return j;
}

}  // namespace detail

/// Value at path, or std::nullopt if missing, null or of another type.
///
///   auto title = traverse_obj<std::string>(info, {"entries", 0, "title"});
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j,
							  std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result || result->is_null()) return std::nullopt;

	try {
		return result->get<T>();
	} catch (const nlohmann::json::type_error &) { return std::nullopt; }
}

template <typename T>
T traverse_obj_default(const nlohmann::json &j,
					   std::initializer_list<PathElement> path, T default_val) {
	return traverse_obj<T>(j, path).value_or(std::move(default_val));
}

inline const nlohmann::json *traverse_json(
	const nlohmann::json &j, std::initializer_list<PathElement> path) {
	return detail::traverse(&j, path);
}

}  // namespace dlpoll::utils
