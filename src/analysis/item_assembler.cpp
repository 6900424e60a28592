#include <menuscan/analysis/item_assembler.hpp>
#include <menuscan/analysis/menu_semantics.hpp>
#include <menuscan/core/reading_order.hpp>
#include <menuscan/core/text_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>

namespace menuscan::analysis {

namespace nc = menuscan::core;

namespace {

constexpr double kEmphasisFontRatio = 1.15;
constexpr double kSameLineTolerance = 0.5;
constexpr std::string_view kPhase = "assembly";

/// Text left for positional assignment, with the token it came from.
struct Positional {
  std::string text;
  const nc::Token* token{nullptr};
};

std::string strip_matched(const std::string& text, const std::string& matched) {
  std::string out = text;
  if (const auto pos = out.find(matched); !matched.empty() && pos != std::string::npos) {
    out.erase(pos, matched.size());
  }
  return nc::collapse_whitespace(out);
}

/// Splits "Name - description" style text on the first separator found.
std::optional<std::pair<std::string, std::string>> split_on_separator(const std::string& text) {
  static constexpr std::array<std::string_view, 4> kSeparators = {" - ", " • ", " | ", "  "};
  for (auto sep : kSeparators) {
    const auto pos = text.find(sep);
    if (pos == std::string::npos) continue;
    auto head = nc::trim(std::string_view(text).substr(0, pos));
    auto tail = nc::trim(std::string_view(text).substr(pos + sep.size()));
    if (!head.empty() && !tail.empty()) return std::make_pair(std::move(head), std::move(tail));
  }
  return std::nullopt;
}

}  // namespace

ItemAssembler::ItemAssembler(const nc::PipelineConfig& config,
                             const nc::ClassificationIndex& classifications)
    : config_(config), classifications_(classifications) {}

ItemComponents ItemAssembler::extract_triple(const nc::Region& region) const {
  const auto ordered = nc::in_reading_order(region.tokens);
  const auto threshold = static_cast<float>(config_.price_classification_threshold);

  ItemComponents out;
  // Strongest price wins; on a tie the later token, usually the right-most, anchors.
  std::optional<nc::NumberClassification> anchor_price;
  for (const auto& t : ordered) {
    auto price = classifications_.best_price(t, threshold);
    if (price && (!anchor_price || price->confidence >= anchor_price->confidence)) {
      anchor_price = std::move(price);
    }
  }

  std::vector<Positional> positional;
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    const auto& t = ordered[i];
    auto price = classifications_.best_price(t, threshold);
    if (!price) {
      positional.push_back({nc::collapse_whitespace(t.text), &t});
      continue;
    }
    auto leftover = strip_matched(t.text, price->matched_text);
    if (nc::contains_letter(leftover)) positional.push_back({std::move(leftover), &t});
  }

  if (anchor_price) {
    out.price = anchor_price->value;
    out.price_confidence = anchor_price->confidence;
    out.anchored = true;
  } else {
    // Positional fallback: the last purely numeric token supplies the price.
    for (auto it = positional.rbegin(); it != positional.rend(); ++it) {
      if (nc::contains_letter(it->text)) continue;
      const auto numbers = classifications_.for_token(*it->token);
      if (numbers.empty()) continue;
      out.price = numbers.back().value;
      out.price_confidence = numbers.back().confidence;
      positional.erase(std::next(it).base());
      break;
    }
  }

  if (positional.empty()) return out;

  if (positional.size() == 1) {
    if (auto split = split_on_separator(positional.front().text)) {
      out.name = std::move(split->first);
      out.description = std::move(split->second);
      return out;
    }
  }

  // A bold or larger token overrides the positional name when the first one is plain.
  const double avg_font = region.average_font_size();
  auto emphasized = [&](const Positional& p) {
    return p.token->is_bold() || p.token->effective_font_size() >= kEmphasisFontRatio * avg_font;
  };
  std::size_t name_index = 0;
  if (!emphasized(positional.front())) {
    for (std::size_t i = 1; i < positional.size(); ++i) {
      const std::size_t len = nc::utf8_length(positional[i].text);
      if (emphasized(positional[i]) && len >= config_.name_min_length &&
          len <= config_.name_max_length) {
        name_index = i;
        break;
      }
    }
  }

  out.name = positional[name_index].text;
  std::vector<std::string> rest;
  for (std::size_t i = 0; i < positional.size(); ++i) {
    if (i != name_index) rest.push_back(positional[i].text);
  }
  if (auto description = nc::join_trimmed(rest); !description.empty()) {
    out.description = std::move(description);
  }
  return out;
}

ItemComponents ItemAssembler::extract_pair(const nc::Region& region) const {
  const auto ordered = nc::in_reading_order(region.tokens);
  const auto threshold = static_cast<float>(config_.price_classification_threshold);

  ItemComponents out;
  std::vector<const nc::Token*> names;
  for (const auto& t : ordered) {
    auto price = classifications_.best_price(t, threshold);
    if (price && (!out.price || price->confidence >= out.price_confidence)) {
      out.price = price->value;
      out.price_confidence = price->confidence;
      out.anchored = true;
    }
    if (!price && nc::contains_letter(t.text)) names.push_back(&t);
  }
  if (names.empty()) return out;

  for (const auto* t : names) {
    if (nc::contains_cjk(t->text) && nc::contains_latin(t->text)) {
      out.name = nc::collapse_whitespace(t->text);
      return out;
    }
  }

  for (const auto* cjk : names) {
    if (!nc::contains_cjk(cjk->text)) continue;
    for (const auto* latin : names) {
      if (latin == cjk || nc::contains_cjk(latin->text) || !nc::contains_latin(latin->text)) continue;
      const double tol = kSameLineTolerance * std::max(cjk->effective_font_size(), latin->effective_font_size());
      if (std::abs(cjk->top() - latin->top()) > tol) continue;
      const bool cjk_first = cjk->x <= latin->x;
      out.name = nc::collapse_whitespace(cjk_first ? cjk->text + " " + latin->text
                                                   : latin->text + " " + cjk->text);
      return out;
    }
  }

  out.name = nc::collapse_whitespace(names.front()->text);
  return out;
}

std::optional<nc::MenuItem> ItemAssembler::assemble(const nc::Region& region,
                                                    nc::AssemblyMode mode,
                                                    nc::ProcessingPhase phase) const {
  auto parts = mode == nc::AssemblyMode::Pair ? extract_pair(region) : extract_triple(region);
  if (!parts.name) return std::nullopt;

  const std::string name = clean_item_name(*parts.name);
  const std::size_t len = nc::utf8_length(name);
  if (len < config_.name_min_length || len > config_.name_max_length || !nc::contains_letter(name)) {
    return std::nullopt;
  }
  if (!parts.price && !config_.allow_priceless_items) return std::nullopt;

  nc::MenuItem item;
  item.id = region_item_id(region);
  item.name = name;
  if (mode != nc::AssemblyMode::Pair && parts.description) {
    item.description = nc::collapse_whitespace(*parts.description);
  }
  item.price = parts.price;
  const std::string description = item.description.value_or("");
  item.category = categorize(item.name, description);
  item.serving_size = estimate_serving_size(item.name, description);
  item.confidence = parts.anchored
                        ? nc::clamp_confidence(0.6 * region.confidence + 0.4 * parts.price_confidence)
                        : nc::clamp_confidence(0.6 * region.confidence);
  item.provenance.phase = (phase == nc::ProcessingPhase::RegionAssembly && mode == nc::AssemblyMode::Pair)
                              ? nc::ProcessingPhase::PairAssembly
                              : phase;
  item.provenance.page_index = region.page_index;
  item.provenance.region_box = region.bbox;
  item.thumbnail = region.thumbnail;
  return item;
}

std::vector<nc::MenuItem> ItemAssembler::assemble_all(const std::vector<nc::Region>& regions,
                                                      nc::ParseLog& log,
                                                      nc::ProcessingPhase phase) const {
  const auto mode = resolve_mode(config_.assembly_mode, regions);
  std::vector<nc::MenuItem> items;
  items.reserve(regions.size());
  for (const auto& region : regions) {
    if (auto item = assemble(region, mode, phase)) {
      items.push_back(std::move(*item));
    } else {
      log.debug(kPhase, "region {} on page {} produced no item", nc::to_string(region.bbox),
                region.page_index);
    }
  }
  log.info(kPhase, "{} items from {} regions ({} mode)", items.size(), regions.size(),
           nc::to_string(mode));
  return items;
}

nc::AssemblyMode ItemAssembler::resolve_mode(nc::AssemblyMode mode,
                                             const std::vector<nc::Region>& regions) {
  if (mode != nc::AssemblyMode::Auto) return mode;
  if (regions.empty()) return nc::AssemblyMode::Triple;
  const auto small = std::count_if(regions.begin(), regions.end(),
                                   [](const nc::Region& r) { return r.tokens.size() <= 2; });
  return static_cast<std::size_t>(small) * 2 > regions.size() ? nc::AssemblyMode::Pair
                                                              : nc::AssemblyMode::Triple;
}

std::string region_item_id(const nc::Region& region) {
  return fmt::format("region-p{}-{}-{}", region.page_index, std::lround(region.bbox.x),
                     std::lround(region.bbox.y));
}

}  // namespace menuscan::analysis
