#include <menuscan/app/token_loader.hpp>
#include <menuscan/core/text_utils.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <vector>

namespace menuscan::app {

namespace nc = menuscan::core;

namespace {

constexpr std::size_t kRowFields = 8;

struct PendingPage {
  std::uint32_t index{0};
  double width{0.0};
  double height{0.0};
  std::vector<nc::Token> tokens;
};

template <typename T>
bool parse_field(std::string_view s, T& out) {
  s = nc::trim_view(s);
  const char* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

/// Splits on tabs; the last field keeps any remaining tabs.
std::vector<std::string_view> split_row(std::string_view line, std::size_t fields) {
  std::vector<std::string_view> out;
  while (out.size() + 1 < fields) {
    const auto pos = line.find('\t');
    if (pos == std::string_view::npos) break;
    out.push_back(line.substr(0, pos));
    line.remove_prefix(pos + 1);
  }
  out.push_back(line);
  return out;
}

std::optional<PendingPage> parse_page_directive(std::string_view line) {
  std::istringstream in{std::string(line.substr(5))};
  PendingPage page;
  if (!(in >> page.index >> page.width >> page.height)) return std::nullopt;
  return page;
}

std::optional<nc::Token> parse_row(std::string_view line) {
  const auto f = split_row(line, kRowFields);
  if (f.size() != kRowFields) return std::nullopt;

  nc::Token t;
  if (!parse_field(f[0], t.x) || !parse_field(f[1], t.y) || !parse_field(f[2], t.width) ||
      !parse_field(f[3], t.height) || !parse_field(f[4], t.font_size)) {
    return std::nullopt;
  }
  const auto family = nc::trim_view(f[5]);
  if (!family.empty() && family != "-") t.font_family = std::string(family);
  const auto weight = nc::trim_view(f[6]);
  if (!weight.empty() && weight != "-") {
    int w = 0;
    if (!parse_field(weight, w)) return std::nullopt;
    t.font_weight = w;
  }
  t.text = std::string(f[7]);
  return t;
}

}  // namespace

std::expected<nc::Document, nc::PipelineError> parse_token_stream(std::istream& in,
                                                                   const std::string& source_name) {
  std::vector<PendingPage> pages;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (nc::trim_view(line).empty()) continue;

    if (line.starts_with("#page")) {
      auto page = parse_page_directive(line);
      if (!page) {
        spdlog::error("{}:{}: malformed #page directive", source_name, line_no);
        return std::unexpected(nc::PipelineError::MalformedInput);
      }
      pages.push_back(std::move(*page));
      continue;
    }
    if (line.front() == '#') continue;

    auto token = parse_row(line);
    if (!token) {
      spdlog::error("{}:{}: malformed token row", source_name, line_no);
      return std::unexpected(nc::PipelineError::MalformedInput);
    }
    if (pages.empty()) pages.emplace_back();
    pages.back().tokens.push_back(std::move(*token));
  }

  nc::Document doc;
  doc.source_name = source_name;
  doc.pages.reserve(pages.size());
  for (auto& p : pages) {
    doc.pages.push_back(nc::make_page(p.index, p.width, p.height, std::move(p.tokens)));
  }
  spdlog::debug("loaded {} pages, {} tokens from {}", doc.pages.size(), doc.token_count(), source_name);
  return doc;
}

std::expected<nc::Document, nc::PipelineError> load_token_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    spdlog::error("cannot open token file '{}'", path);
    return std::unexpected(nc::PipelineError::LoadFailed);
  }
  return parse_token_stream(f, path);
}

}  // namespace menuscan::app
