/**
 * menuscan-cli: Parse a menu token dump into structured items.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/menuscan_cli --tokens menu.tsv [--config path] [--page-image 0:page0.png]
 * Also writes results to output/<basename>.txt (same content as terminal).
 */

#include <menuscan/app/config.hpp>
#include <menuscan/app/pipeline_factory.hpp>
#include <menuscan/app/pipeline_runner.hpp>
#include <menuscan/app/token_loader.hpp>
#include <menuscan/core/menu_item.hpp>
#include <menuscan/core/pipeline.hpp>
#include <menuscan/core/session.hpp>
#include <menuscan/vision/image_page_renderer.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <charconv>
#include <expected>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: menuscan_cli --tokens <path> [options]\n"
            << "  --tokens <path>          Token dump (#page directives + tab-separated rows)\n"
            << "  --config <path>          Pipeline config (key=value file); default: built-in\n"
            << "  --page-image <idx:path>  Pre-rendered image for page idx (repeatable)\n"
            << "  --mode <m>               Region detection: proximity | box | auto\n"
            << "  --assembly <m>           Item assembly: triple | pair | auto\n"
            << "  --no-thumbnails          Skip region thumbnails\n"
            << "  --log-level <level>      trace | debug | info | warn | error | off (default info)\n";
}

bool parse_page_image(const std::string& arg, std::uint32_t& index, std::string& path) {
  const auto colon = arg.find(':');
  if (colon == std::string::npos || colon == 0) return false;
  const char* first = arg.data();
  const char* last = arg.data() + colon;
  auto [ptr, ec] = std::from_chars(first, last, index);
  if (ec != std::errc{} || ptr != last) return false;
  path = arg.substr(colon + 1);
  return !path.empty();
}

std::string format_item(const menuscan::core::MenuItem& item) {
  std::string line = fmt::format("  [{}] {}", item.id, item.name);
  if (item.price) line += fmt::format(" ${:.2f}", *item.price);
  line += fmt::format(" ({}, serves {}, confidence {:.2f}, {})", item.category, item.serving_size,
                      item.confidence, menuscan::core::to_string(item.provenance.phase));
  if (item.description) line += fmt::format("\n      {}", *item.description);
  return line + "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  auto logger = spdlog::stdout_color_mt("menuscan");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  std::string tokens_path;
  std::string config_path;
  std::string mode_override;
  std::string assembly_override;
  std::string log_level = "info";
  bool no_thumbnails = false;
  std::map<std::uint32_t, std::string> page_images;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--tokens" && i + 1 < argc) {
      tokens_path = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--page-image" && i + 1 < argc) {
      std::uint32_t index = 0;
      std::string path;
      if (!parse_page_image(argv[++i], index, path)) {
        std::cerr << "Invalid --page-image " << argv[i] << " (use <index>:<path>)\n";
        return 1;
      }
      page_images[index] = path;
    } else if (arg == "--mode" && i + 1 < argc) {
      mode_override = argv[++i];
    } else if (arg == "--assembly" && i + 1 < argc) {
      assembly_override = argv[++i];
    } else if (arg == "--no-thumbnails") {
      no_thumbnails = true;
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  spdlog::set_level(spdlog::level::from_str(log_level));

  if (tokens_path.empty()) {
    print_usage();
    return 1;
  }

  std::expected<menuscan::core::PipelineConfig, menuscan::core::PipelineError> cfg =
      menuscan::app::default_config();
  if (!config_path.empty()) cfg = menuscan::app::load_config(config_path);
  if (!cfg) {
    std::cerr << "Config error: " << menuscan::core::to_string(cfg.error()) << "\n";
    return 1;
  }
  if (!mode_override.empty()) {
    auto mode = menuscan::app::parse_detection_mode(mode_override);
    if (!mode) {
      std::cerr << "Unknown --mode " << mode_override << " (use proximity, box, or auto)\n";
      return 1;
    }
    cfg->detection_mode = *mode;
  }
  if (!assembly_override.empty()) {
    auto mode = menuscan::app::parse_assembly_mode(assembly_override);
    if (!mode) {
      std::cerr << "Unknown --assembly " << assembly_override << " (use triple, pair, or auto)\n";
      return 1;
    }
    cfg->assembly_mode = *mode;
  }
  if (no_thumbnails) cfg->capture_thumbnails = false;
  if (auto valid = menuscan::core::validate_config(*cfg); !valid) {
    std::cerr << "Config error: " << menuscan::core::to_string(valid.error()) << "\n";
    return 1;
  }

  auto document = menuscan::app::load_token_file(tokens_path);
  if (!document) {
    std::cerr << "Failed to load tokens: " << menuscan::core::to_string(document.error()) << "\n";
    return 1;
  }

  menuscan::vision::ImagePageRenderer renderer;
  for (const auto& page : document->pages) {
    if (auto it = page_images.find(page.index); it != page_images.end()) {
      renderer.add_page(page.index, {it->second, menuscan::core::page_width(page),
                                     menuscan::core::page_height(page)});
    }
  }

  menuscan::core::RunOptions options;
  if (!page_images.empty()) options.renderer = &renderer;
  options.progress = [](const menuscan::core::ProgressSnapshot& p) {
    spdlog::debug("progress {}% [{}] {}", p.percent, p.phase, p.message);
  };

  const menuscan::core::Pipeline pipeline = menuscan::app::build_pipeline(*cfg);
  auto result = menuscan::app::run_pipeline(pipeline, *document, options);
  if (!result) {
    std::cerr << "Pipeline error: " << menuscan::core::to_string(result.error()) << "\n";
    return 1;
  }

  std::ostringstream out;
  out << "document=" << document->source_name << " items=" << result->items.size()
      << " regions=" << result->validated_regions << "/" << result->candidate_regions
      << " font_groups=" << result->fingerprints.size();
  if (result->bootstrap.triggered) {
    out << " bootstrap_iterations=" << result->bootstrap.iterations;
  }
  out << "\n";
  for (const auto& item : result->items) {
    out << format_item(item);
  }
  const std::string text = out.str();
  std::cout << text;

  std::filesystem::path p(tokens_path);
  std::filesystem::path out_dir("output");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
  std::ofstream f(out_file);
  if (f) {
    f << text;
  } else {
    spdlog::warn("could not write {}", out_file.string());
  }
  return 0;
}
