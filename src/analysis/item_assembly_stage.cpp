#include <menuscan/analysis/item_assembly_stage.hpp>
#include <menuscan/analysis/bootstrap.hpp>
#include <menuscan/analysis/fallback_parser.hpp>
#include <menuscan/analysis/item_assembler.hpp>
#include <menuscan/analysis/region_validator.hpp>
#include <menuscan/analysis/token_classifier.hpp>

namespace menuscan::analysis {

namespace nc = menuscan::core;

ItemAssemblyStage::ItemAssemblyStage(const nc::PipelineConfig& config) : config_(config) {}

std::expected<void, nc::PipelineError> ItemAssemblyStage::process(nc::ParseSession& session) const {
  ItemAssembler assembler(config_, session.classifications());
  const auto threshold = static_cast<float>(config_.price_classification_threshold);

  BootstrapController::Hooks hooks;
  hooks.assemble = [&]() { return assembler.assemble_all(session.validated_regions(), session.log()); };
  hooks.fallback = [&]() { return FallbackParser(config_).parse(session.document()); };
  hooks.refine = [&](const ClassifierPatterns& patterns) {
    TokenClassifier classifier(config_, patterns);
    session.classifications() = classifier.classify_document(session.document()).index;

    RegionValidator validator(config_, session.classifications());
    auto revisited = validator.validate_all(std::move(session.price_rejected_regions()),
                                            session.page_cache(), session.log());
    session.price_rejected_regions() = std::move(revisited.price_rejected);
    session.log().info(name(), "refinement recovered {} price-less regions", revisited.accepted.size());

    auto items = assembler.assemble_all(session.validated_regions(), session.log());
    auto recovered = assembler.assemble_all(revisited.accepted, session.log(),
                                            nc::ProcessingPhase::Refinement);
    items.insert(items.end(), std::make_move_iterator(recovered.begin()),
                 std::make_move_iterator(recovered.end()));
    auto& validated = session.validated_regions();
    validated.insert(validated.end(), std::make_move_iterator(revisited.accepted.begin()),
                     std::make_move_iterator(revisited.accepted.end()));
    return items;
  };
  hooks.count_prices = [&session, threshold]() {
    return session.classifications().count(nc::NumberType::Price, threshold);
  };

  const std::size_t price_count = hooks.count_prices();
  BootstrapController controller(config_, std::move(hooks));
  auto items = controller.run(price_count, session.stop_token(), session.log(),
                              session.bootstrap_report());
  if (!items) {
    return std::unexpected(items.error());
  }

  session.items() = std::move(*items);
  const auto& report = session.bootstrap_report();
  session.log().info(name(), "{} items (bootstrap {}, {} iterations, quality {:.2f} -> {:.2f})",
                     session.items().size(), report.triggered ? "triggered" : "not needed",
                     report.iterations, report.initial_quality, report.final_quality);
  return {};
}

}  // namespace menuscan::analysis
