#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace menuscan::core {

/// View without leading/trailing ASCII whitespace.
[[nodiscard]] std::string_view trim_view(std::string_view s) noexcept;

[[nodiscard]] std::string trim(std::string_view s);

/// Runs of ASCII whitespace become a single space; result is trimmed.
[[nodiscard]] std::string collapse_whitespace(std::string_view s);

[[nodiscard]] std::string to_lower_ascii(std::string_view s);

/// Number of UTF-8 code points (invalid bytes count as one each).
[[nodiscard]] std::size_t utf8_length(std::string_view s) noexcept;

/// Decodes UTF-8 into code points; invalid bytes decode to U+FFFD.
[[nodiscard]] std::vector<char32_t> decode_utf8(std::string_view s);

[[nodiscard]] bool is_cjk(char32_t cp) noexcept;
[[nodiscard]] bool is_latin_letter(char32_t cp) noexcept;

[[nodiscard]] bool contains_cjk(std::string_view s);
[[nodiscard]] bool contains_latin(std::string_view s);

/// Latin or CJK letter anywhere in the string.
[[nodiscard]] bool contains_letter(std::string_view s);

/// Uniqueness key for item names: ASCII lowercase, ASCII punctuation removed,
/// whitespace collapsed. Non-ASCII code points are kept as-is.
[[nodiscard]] std::string normalize_name(std::string_view name);

/// Joins non-blank parts with a separator, trimming each part.
[[nodiscard]] std::string join_trimmed(const std::vector<std::string>& parts,
                                       std::string_view separator = " ");

}  // namespace menuscan::core
