#include <menuscan/analysis/classification_stage.hpp>
#include <menuscan/analysis/token_classifier.hpp>
#include <menuscan/core/classification.hpp>

namespace menuscan::analysis {

namespace nc = menuscan::core;

ClassificationStage::ClassificationStage(const nc::PipelineConfig& config) : config_(config) {}

std::expected<void, nc::PipelineError> ClassificationStage::process(nc::ParseSession& session) const {
  TokenClassifier classifier(config_);
  auto out = classifier.classify_document(session.document());

  const auto threshold = static_cast<float>(config_.price_classification_threshold);
  session.log().info(name(), "{} numbers classified, {} prices, {} font fingerprints",
                     out.index.size(), out.index.count(nc::NumberType::Price, threshold),
                     out.fingerprints.size());
  for (const auto& [key, fp] : out.fingerprints) {
    session.log().debug(name(), "fingerprint {} {:.1f} {}: {} tokens, {} patterns, confidence {:.2f}",
                        key.font_family, key.font_size, key.font_weight, fp.sample_count,
                        fp.patterns.size(), fp.confidence);
  }

  session.classifications() = std::move(out.index);
  session.fingerprints() = std::move(out.fingerprints);
  return {};
}

}  // namespace menuscan::analysis
