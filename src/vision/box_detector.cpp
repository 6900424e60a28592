#include <menuscan/vision/box_detector.hpp>
#include "raster_cv_utils.hpp"
#include <menuscan/core/reading_order.hpp>
#include <menuscan/core/text_patterns.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace menuscan::vision {

namespace nc = menuscan::core;

namespace {

constexpr double kMaxSobel = 1020.0;  // 3x3 Sobel on 8-bit input
constexpr double kFuseDistance = 3.0;
constexpr double kSpanTolerance = 4.0;

/// Normalized Sobel magnitude, pixels below `threshold` set to 0.
cv::Mat edge_magnitude(const cv::Mat& gray, double threshold) {
  cv::Mat gx;
  cv::Mat gy;
  cv::Sobel(gray, gx, CV_32F, 1, 0, 3);
  cv::Sobel(gray, gy, CV_32F, 0, 1, 3);
  cv::Mat mag;
  cv::magnitude(gx, gy, mag);
  mag = mag / kMaxSobel;
  cv::threshold(mag, mag, 1.0, 1.0, cv::THRESH_TRUNC);
  cv::threshold(mag, mag, threshold, 0.0, cv::THRESH_TOZERO);
  return mag;
}

/// Scans one row or column for runs of non-zero magnitude.
template <typename At>
void scan_runs(int length, At&& at, double min_length, double min_strength,
               LineOrientation orientation, double position, std::vector<EdgeLine>& out) {
  int start = -1;
  double sum = 0.0;
  for (int i = 0; i <= length; ++i) {
    const float v = i < length ? at(i) : 0.f;
    if (v > 0.f) {
      if (start < 0) {
        start = i;
        sum = 0.0;
      }
      sum += v;
      continue;
    }
    if (start >= 0) {
      const int run = i - start;
      const double mean = sum / run;
      if (run >= min_length && mean >= min_strength) {
        out.push_back(EdgeLine{orientation, position, static_cast<double>(start),
                               static_cast<double>(i - 1), static_cast<float>(mean)});
      }
      start = -1;
    }
  }
}

bool spans_overlap(const EdgeLine& a, const EdgeLine& b) noexcept {
  return a.start <= b.end && b.start <= a.end;
}

/// Fuses lines of one orientation lying within kFuseDistance of each other.
std::vector<EdgeLine> fuse_lines(std::vector<EdgeLine> lines) {
  std::sort(lines.begin(), lines.end(),
            [](const EdgeLine& a, const EdgeLine& b) { return a.position < b.position; });

  struct Group {
    EdgeLine line;
    double last_position;
    double position_sum;
    int count;
  };
  std::vector<Group> groups;
  for (const auto& l : lines) {
    auto it = std::find_if(groups.begin(), groups.end(), [&](const Group& g) {
      return l.position - g.last_position <= kFuseDistance && spans_overlap(g.line, l);
    });
    if (it == groups.end()) {
      groups.push_back(Group{l, l.position, l.position, 1});
      continue;
    }
    it->line.start = std::min(it->line.start, l.start);
    it->line.end = std::max(it->line.end, l.end);
    it->line.strength = std::max(it->line.strength, l.strength);
    it->last_position = l.position;
    it->position_sum += l.position;
    ++it->count;
  }

  std::vector<EdgeLine> fused;
  fused.reserve(groups.size());
  for (auto& g : groups) {
    g.line.position = g.position_sum / g.count;
    fused.push_back(g.line);
  }
  return fused;
}

}  // namespace

BoxDetector::BoxDetector(const nc::PipelineConfig& config) : config_(config) {}

std::expected<std::vector<EdgeLine>, nc::PipelineError> BoxDetector::detect_lines(
    const nc::Raster& raster) const {
  auto gray = detail::raster_to_gray(raster);
  if (!gray) {
    return std::unexpected(nc::PipelineError::RenderFailed);
  }
  const cv::Mat mag = edge_magnitude(*gray, config_.edge_threshold);

  const double min_length = config_.min_line_length_px;
  std::vector<EdgeLine> horizontal;
  for (int r = 0; r < mag.rows; ++r) {
    const float* row = mag.ptr<float>(r);
    scan_runs(mag.cols, [row](int i) { return row[i]; }, min_length, config_.line_threshold,
              LineOrientation::Horizontal, r, horizontal);
  }
  std::vector<EdgeLine> vertical;
  for (int c = 0; c < mag.cols; ++c) {
    scan_runs(mag.rows, [&mag, c](int i) { return mag.at<float>(i, c); }, min_length,
              config_.line_threshold, LineOrientation::Vertical, c, vertical);
  }

  auto lines = fuse_lines(std::move(horizontal));
  auto fused_vertical = fuse_lines(std::move(vertical));
  lines.insert(lines.end(), fused_vertical.begin(), fused_vertical.end());
  return lines;
}

std::vector<BoxCandidate> BoxDetector::find_rectangles(const std::vector<EdgeLine>& lines) const {
  std::vector<EdgeLine> horizontal;
  std::vector<EdgeLine> vertical;
  for (const auto& l : lines) {
    (l.orientation == LineOrientation::Horizontal ? horizontal : vertical).push_back(l);
  }
  std::sort(horizontal.begin(), horizontal.end(),
            [](const EdgeLine& a, const EdgeLine& b) { return a.position < b.position; });
  std::sort(vertical.begin(), vertical.end(),
            [](const EdgeLine& a, const EdgeLine& b) { return a.position < b.position; });

  const double min_size = config_.min_box_size_px;
  std::vector<BoxCandidate> boxes;
  for (std::size_t i = 0; i < horizontal.size(); ++i) {
    const auto& top = horizontal[i];
    for (std::size_t j = i + 1; j < horizontal.size(); ++j) {
      const auto& bottom = horizontal[j];
      if (bottom.position - top.position < min_size) continue;
      const double left = std::max(top.start, bottom.start);
      const double right = std::min(top.end, bottom.end);
      if (right - left < min_size) continue;

      std::vector<const EdgeLine*> sides;
      for (const auto& v : vertical) {
        if (v.position < left - kSpanTolerance || v.position > right + kSpanTolerance) continue;
        if (v.start > top.position + kSpanTolerance) continue;
        if (v.end < bottom.position - kSpanTolerance) continue;
        sides.push_back(&v);
      }
      bool emitted = false;
      for (std::size_t k = 0; k + 1 < sides.size(); ++k) {
        const auto* l = sides[k];
        const auto* r = sides[k + 1];
        if (r->position - l->position < min_size) continue;
        const double strength = (top.strength + bottom.strength + l->strength + r->strength) / 4.0;
        boxes.push_back(BoxCandidate{
            PixelRect{l->position, top.position, r->position - l->position,
                      bottom.position - top.position},
            nc::clamp_confidence(strength)});
        emitted = true;
      }
      // Nearest lower line that closes a box; lines of nested frames are skipped.
      if (emitted) break;
    }
  }
  return boxes;
}

std::vector<BoxCandidate> BoxDetector::merge_overlapping(std::vector<BoxCandidate> boxes,
                                                         double overlap) {
  bool merged = true;
  while (merged) {
    merged = false;
    for (std::size_t i = 0; i < boxes.size() && !merged; ++i) {
      for (std::size_t j = i + 1; j < boxes.size(); ++j) {
        const double smaller = std::min(boxes[i].rect.area(), boxes[j].rect.area());
        if (smaller <= 0.0 || intersection_area(boxes[i].rect, boxes[j].rect) <= overlap * smaller) {
          continue;
        }
        boxes[i].rect = union_rect(boxes[i].rect, boxes[j].rect);
        boxes[i].confidence = std::max(boxes[i].confidence, boxes[j].confidence);
        boxes.erase(boxes.begin() + static_cast<std::ptrdiff_t>(j));
        merged = true;
        break;
      }
    }
  }
  return boxes;
}

bool BoxDetector::is_valid_box(const PixelRect& rect,
                               std::uint32_t raster_width,
                               std::uint32_t raster_height) const noexcept {
  if (rect.width < config_.min_box_size_px || rect.height < config_.min_box_size_px) return false;
  const double aspect = rect.width / rect.height;
  if (aspect < config_.box_aspect_min || aspect > config_.box_aspect_max) return false;
  const double margin = config_.box_edge_margin_px;
  return rect.x >= margin && rect.y >= margin && rect.right() <= raster_width - margin &&
         rect.bottom() <= raster_height - margin;
}

std::optional<nc::Region> BoxDetector::region_from_box(const BoxCandidate& box,
                                                       const nc::Page& page,
                                                       double scale) const {
  const double height = nc::page_height(page);
  const nc::BBox doc = pixels_to_document(box.rect, height, scale);
  if (doc.height <= 0.0) return std::nullopt;

  std::vector<nc::Token> inside;
  for (const auto& t : page.tokens) {
    if (nc::is_usable(t) && doc.contains(t, config_.box_token_padding)) inside.push_back(t);
  }
  if (inside.size() < 2) return std::nullopt;

  std::size_t top = 0;
  std::size_t middle = 0;
  std::size_t bottom_currency = 0;
  std::size_t bottom = 0;
  for (const auto& t : inside) {
    const double rel = (t.center_y() - doc.y) / doc.height;
    if (rel >= 2.0 / 3.0) {
      ++top;
    } else if (rel < 1.0 / 3.0) {
      ++bottom;
      if (nc::matches_currency(t.text)) ++bottom_currency;
    } else {
      ++middle;
    }
  }
  if (top == 0 || bottom_currency == 0 || middle > top + bottom) {
    spdlog::debug("[regions] page {}: box {} fails layout gate (top {}, middle {}, bottom {})",
                  page.index, nc::to_string(doc), top, middle, bottom);
    return std::nullopt;
  }

  return nc::make_region(nc::in_reading_order(inside), page.index, height,
                         nc::RegionSource::BorderedBox, box.confidence);
}

std::expected<std::vector<nc::Region>, nc::PipelineError> BoxDetector::detect(
    const nc::Raster& raster, const nc::Page& page, double scale) const {
  auto lines = detect_lines(raster);
  if (!lines) {
    return std::unexpected(lines.error());
  }

  auto boxes = merge_overlapping(find_rectangles(*lines), config_.box_merge_overlap);
  std::vector<nc::Region> regions;
  for (const auto& box : boxes) {
    if (!is_valid_box(box.rect, raster.width(), raster.height())) continue;
    if (auto region = region_from_box(box, page, scale)) {
      regions.push_back(std::move(*region));
    }
  }
  spdlog::debug("[regions] page {}: {} lines, {} boxes, {} regions", page.index, lines->size(),
                boxes.size(), regions.size());
  return regions;
}

}  // namespace menuscan::vision
