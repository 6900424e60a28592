#include <menuscan/analysis/token_classifier.hpp>
#include <menuscan/core/region.hpp>
#include <menuscan/core/text_patterns.hpp>
#include <menuscan/core/text_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <regex>
#include <utility>

namespace menuscan::analysis {

namespace nc = menuscan::core;

namespace {

const std::regex& currency_layer() {
  static const std::regex re(
      R"((\$|€|£|¥|USD|EUR)\s?(\d{1,3}(?:,\d{3})+(?:\.\d{1,2})?|\d+(?:[.,]\d{1,2})?))",
      std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex& unit_layer() {
  static const std::regex re(
      R"((\d+(?:\.\d+)?)\s*(kcal|calories|calorie|cals?|ounces?|oz|lbs?|pounds?|inch(?:es)?|in\.|feet|foot|ft|lit(?:er|re)s?|ml|l|"|')(?![a-z]))",
      std::regex::ECMAScript | std::regex::icase);
  return re;
}

const std::regex& bare_layer() {
  static const std::regex re(R"(\d{1,3}(?:,\d{3})+(?:\.\d+)?|\d+(?:[.,]\d+)?)");
  return re;
}

const std::regex& item_number_whole() {
  static const std::regex re(R"(^#?\d+$)");
  return re;
}

const std::regex& item_number_prefixed() {
  static const std::regex re(R"(No\.\s*\d+)", std::regex::ECMAScript | std::regex::icase);
  return re;
}

struct Span {
  std::size_t begin;
  std::size_t end;
};

bool overlaps(const std::vector<Span>& claimed, std::size_t b, std::size_t e) {
  return std::any_of(claimed.begin(), claimed.end(),
                     [&](const Span& s) { return b < s.end && s.begin < e; });
}

/// Parses "1,200.50", "12,50" (decimal comma) and "12.5".
double parse_number(std::string digits, bool& is_integer, bool& two_decimals) {
  const bool has_comma = digits.find(',') != std::string::npos;
  const bool has_dot = digits.find('.') != std::string::npos;
  if (has_comma && has_dot) {
    digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
  } else if (has_comma) {
    const std::size_t after = digits.size() - digits.rfind(',') - 1;
    if (after == 3) {
      digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
    } else {
      std::replace(digits.begin(), digits.end(), ',', '.');
    }
  }
  const auto point = digits.find('.');
  is_integer = point == std::string::npos;
  two_decimals = !is_integer && digits.size() - point - 1 == 2;
  try {
    return std::stod(digits);
  } catch (const std::exception&) {
    is_integer = false;
    two_decimals = false;
    return 0.0;
  }
}

template <typename Fn>
void for_each_match(const std::string& text, const std::regex& re, Fn&& fn) {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
    fn(*it);
  }
}

}  // namespace

std::vector<NumberRule> make_number_rules(const nc::PipelineConfig& config,
                                          const ClassifierPatterns& patterns) {
  std::vector<NumberRule> rules;
  const double price_min = config.price_min;
  const double price_max = config.price_max;
  rules.push_back({"currency format within price range",
                   [=](const NumberCandidate& c) {
                     const bool currency = c.currency_marker || (c.two_decimals && c.unit == UnitKind::None);
                     return currency && c.value >= price_min && c.value <= price_max;
                   },
                   nc::NumberType::Price, 0.9f});

  const double cal_min = config.calorie_min;
  const double cal_max = config.calorie_max;
  rules.push_back({"integer with calorie suffix",
                   [=](const NumberCandidate& c) {
                     return c.unit == UnitKind::Calorie && c.is_integer && c.value >= cal_min &&
                            c.value <= cal_max;
                   },
                   nc::NumberType::Calorie, 0.85f});

  rules.push_back({"adjacent measurement unit",
                   [](const NumberCandidate& c) { return c.unit == UnitKind::Measurement; },
                   nc::NumberType::Measurement, 0.8f});

  if (patterns.has_price_range()) {
    const double lo = *patterns.learned_price_min;
    const double hi = *patterns.learned_price_max;
    rules.push_back({"bare number within learned price range",
                     [=](const NumberCandidate& c) {
                       return c.numeric_token && !c.currency_marker && c.unit == UnitKind::None &&
                              c.value >= lo && c.value <= hi && c.value > 0.0;
                     },
                     nc::NumberType::Price, 0.75f});
  }

  const double count_max = config.count_max;
  rules.push_back({"small integer without currency",
                   [=](const NumberCandidate& c) {
                     return c.is_integer && !c.currency_marker && c.value <= count_max;
                   },
                   nc::NumberType::Count, 0.6f});

  rules.push_back({"item number shape",
                   [](const NumberCandidate& c) { return c.item_number_token; },
                   nc::NumberType::ItemNumber, 0.7f});

  rules.push_back({"no rule matched", [](const NumberCandidate&) { return true; },
                   nc::NumberType::Unknown, 0.3f});
  return rules;
}

std::vector<NumberCandidate> extract_numbers(std::string_view text_view, std::string_view next_text) {
  const std::string text(text_view);
  const std::string trimmed = nc::trim(text_view);
  const bool item_number_token = std::regex_match(trimmed, item_number_whole()) ||
                                 std::regex_search(trimmed, item_number_prefixed());

  struct Found {
    std::size_t pos;
    std::size_t end;
    NumberCandidate c;
  };
  std::vector<Found> found;
  std::vector<Span> claimed;

  for_each_match(text, currency_layer(), [&](const std::smatch& m) {
    const auto b = static_cast<std::size_t>(m.position(0));
    const auto e = b + static_cast<std::size_t>(m.length(0));
    if (overlaps(claimed, b, e)) return;
    NumberCandidate c;
    c.text = m.str(0);
    c.currency_marker = true;
    c.value = parse_number(m.str(2), c.is_integer, c.two_decimals);
    claimed.push_back({b, e});
    found.push_back({b, e, std::move(c)});
  });

  for_each_match(text, unit_layer(), [&](const std::smatch& m) {
    const auto b = static_cast<std::size_t>(m.position(0));
    const auto e = b + static_cast<std::size_t>(m.length(0));
    if (overlaps(claimed, b, e)) return;
    NumberCandidate c;
    c.text = m.str(0);
    c.value = parse_number(m.str(1), c.is_integer, c.two_decimals);
    c.unit = nc::is_calorie_unit(m.str(2)) ? UnitKind::Calorie : UnitKind::Measurement;
    claimed.push_back({b, e});
    found.push_back({b, e, std::move(c)});
  });

  for_each_match(text, bare_layer(), [&](const std::smatch& m) {
    const auto b = static_cast<std::size_t>(m.position(0));
    const auto e = b + static_cast<std::size_t>(m.length(0));
    if (overlaps(claimed, b, e)) return;
    NumberCandidate c;
    c.text = m.str(0);
    c.value = parse_number(m.str(0), c.is_integer, c.two_decimals);
    c.numeric_token = trimmed == c.text;
    claimed.push_back({b, e});
    found.push_back({b, e, std::move(c)});
  });

  std::sort(found.begin(), found.end(), [](const Found& a, const Found& b) { return a.pos < b.pos; });

  std::vector<NumberCandidate> out;
  out.reserve(found.size());
  for (std::size_t i = 0; i < found.size(); ++i) {
    NumberCandidate c = std::move(found[i].c);
    c.item_number_token = item_number_token;
    const bool last = i + 1 == found.size();
    if (last && c.unit == UnitKind::None && !next_text.empty() &&
        nc::trim_view(std::string_view(text).substr(found[i].end)).empty()) {
      if (nc::is_calorie_unit(next_text)) {
        c.unit = UnitKind::Calorie;
      } else if (nc::is_measurement_unit(next_text)) {
        c.unit = UnitKind::Measurement;
      }
    }
    out.push_back(std::move(c));
  }
  return out;
}

TokenClassifier::TokenClassifier(const nc::PipelineConfig& config, ClassifierPatterns patterns)
    : config_(config),
      patterns_(std::move(patterns)),
      rules_(make_number_rules(config_, patterns_)) {}

nc::NumberClassification TokenClassifier::classify_candidate(const NumberCandidate& c) const {
  nc::NumberClassification out;
  out.value = c.value;
  out.matched_text = c.text;
  for (const auto& rule : rules_) {
    if (!rule.predicate(c)) continue;
    out.type = rule.type;
    out.confidence = nc::clamp_confidence(rule.confidence);
    out.reasoning = fmt::format("{} ('{}' -> {})", rule.name, c.text, nc::to_string(rule.type));
    break;
  }
  return out;
}

std::vector<nc::NumberClassification> TokenClassifier::classify(const nc::Token& token,
                                                                const nc::Token* next) const {
  std::vector<nc::NumberClassification> out;
  const std::string_view next_text = next ? std::string_view(next->text) : std::string_view{};
  for (const auto& c : extract_numbers(token.text, next_text)) {
    auto cls = classify_candidate(c);
    cls.page_index = token.page_index;
    cls.ordinal = token.ordinal;
    out.push_back(std::move(cls));
  }
  return out;
}

ClassificationOutput TokenClassifier::classify_document(const nc::Document& document) const {
  ClassificationOutput out;
  std::vector<nc::Token> usable;
  for (const auto& page : document.pages) {
    for (std::size_t i = 0; i < page.tokens.size(); ++i) {
      const auto& token = page.tokens[i];
      if (nc::trim_view(token.text).empty()) continue;
      const nc::Token* next = i + 1 < page.tokens.size() ? &page.tokens[i + 1] : nullptr;
      for (auto& c : classify(token, next)) out.index.add(std::move(c));
      if (nc::is_usable(token)) usable.push_back(token);
    }
  }
  out.fingerprints = build_fingerprints(usable, config_);
  return out;
}

nc::FingerprintKey fingerprint_key(const nc::Token& token) {
  return nc::FingerprintKey{token.family_or_unknown(),
                            std::round(token.effective_font_size() * 10.0) / 10.0,
                            token.font_weight.value_or(400)};
}

nc::FingerprintMap build_fingerprints(const std::vector<nc::Token>& tokens,
                                      const nc::PipelineConfig& config) {
  std::map<nc::FingerprintKey, std::vector<const nc::Token*>> groups;
  for (const auto& t : tokens) groups[fingerprint_key(t)].push_back(&t);

  const std::pair<nc::ContentPattern, bool (*)(std::string_view)> detectors[] = {
      {nc::ContentPattern::PreparationVerb, &nc::contains_preparation_verb},
      {nc::ContentPattern::CurrencyShape, &nc::matches_currency},
      {nc::ContentPattern::UnitShape, &nc::has_unit_suffix},
      {nc::ContentPattern::CategoryWord, &nc::contains_category_word},
  };

  nc::FingerprintMap out;
  for (const auto& [key, members] : groups) {
    if (members.size() < config.fingerprint_min_tokens) continue;

    nc::TypographyFingerprint fp;
    fp.font_family = key.font_family;
    fp.font_size = key.font_size;
    fp.font_weight = key.font_weight;
    fp.sample_count = members.size();

    double total_len = 0.0;
    for (const auto* t : members) total_len += static_cast<double>(nc::utf8_length(nc::trim_view(t->text)));
    fp.average_text_length = total_len / static_cast<double>(members.size());

    for (const auto& [pattern, detect] : detectors) {
      const auto hits = std::count_if(members.begin(), members.end(),
                                      [&](const nc::Token* t) { return detect(t->text); });
      const double support = static_cast<double>(hits) / static_cast<double>(members.size());
      if (support >= config.pattern_min_support) fp.patterns.insert(pattern);
    }

    fp.confidence = nc::clamp_confidence(static_cast<double>(members.size()) /
                                         static_cast<double>(config.fingerprint_saturation));
    out.emplace(key, std::move(fp));
  }
  return out;
}

}  // namespace menuscan::analysis
