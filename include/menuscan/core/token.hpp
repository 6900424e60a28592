#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace menuscan::core {

/// Font slant as reported by the token-extraction collaborator.
enum class FontStyle : std::uint8_t {
  Normal,
  Italic,
  Oblique,
};

/// Positioned text fragment. Coordinates are document space with a bottom-up y axis:
/// the fragment covers [x, x + width] x [y, y + height]; larger y is higher on the page.
struct Token {
  std::string text;
  double x{0.0};
  double y{0.0};
  double width{0.0};
  double height{0.0};
  double font_size{0.0};  // 0 = unknown, height is used instead
  std::optional<std::string> font_family;
  std::optional<int> font_weight;  // CSS scale, 400 regular, 700 bold
  std::optional<FontStyle> font_style;
  std::uint32_t page_index{0};
  std::uint32_t ordinal{0};  // position in the page's ordered token set

  [[nodiscard]] double right() const noexcept { return x + width; }
  [[nodiscard]] double top() const noexcept { return y + height; }
  [[nodiscard]] double center_y() const noexcept { return y + height * 0.5; }

  /// Font size, falling back to the glyph box height when the extractor gave none.
  [[nodiscard]] double effective_font_size() const noexcept {
    return font_size > 0.0 ? font_size : height;
  }

  [[nodiscard]] bool is_bold() const noexcept {
    return font_weight.has_value() && *font_weight >= 600;
  }

  [[nodiscard]] std::string family_or_unknown() const {
    return font_family.value_or("unknown");
  }
};

/// One page of tokens plus its extent in document units.
struct Page {
  std::uint32_t index{0};
  double width{0.0};  // 0 = derive from token extent
  double height{0.0};
  std::vector<Token> tokens;
};

/// Token-level view of a source document, as delivered by the extraction collaborator.
struct Document {
  std::string source_name;
  std::vector<Page> pages;

  [[nodiscard]] std::size_t token_count() const noexcept;
};

/// Builds a Page and stamps page_index / ordinal on every token (ordinal = input order).
[[nodiscard]] Page make_page(std::uint32_t index,
                             double width,
                             double height,
                             std::vector<Token> tokens);

/// Page width, or the right-most token edge when the page carries no width.
[[nodiscard]] double page_width(const Page& page) noexcept;

/// Page height, or the top-most token edge when the page carries no height.
[[nodiscard]] double page_height(const Page& page) noexcept;

/// True for tokens the pipeline can position: non-blank text and a positive box.
[[nodiscard]] bool is_usable(const Token& token) noexcept;

/// Mean effective font size over usable tokens; 0 when there are none.
[[nodiscard]] double average_font_size(const std::vector<Token>& tokens) noexcept;

}  // namespace menuscan::core
