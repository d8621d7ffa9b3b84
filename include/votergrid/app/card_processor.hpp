#pragma once

#include <votergrid/core/card_image.hpp>
#include <votergrid/core/error.hpp>
#include <votergrid/core/geometry.hpp>
#include <votergrid/core/pipeline.hpp>
#include <votergrid/core/voter_record.hpp>
#include <votergrid/ocr/field_extractor.hpp>
#include <functional>

namespace votergrid::app {

/// Called (possibly from a worker thread) when one card degrades: OCR failed,
/// no text was recognized, or the face crop failed. The card still yields a record.
using CardIssueCallback =
    std::function<void(const votergrid::core::CardCell& cell, votergrid::core::PipelineError error)>;

/// Face crop settings; contrast/sharpness 1.0 skip the enhancement.
struct FaceOptions {
  votergrid::core::FaceRatios ratios{};
  float contrast{1.2f};
  float sharpness{1.3f};
};

/// Turns one card into one record: fields from OCR plus the face thumbnail.
/// Never fails; every per-card problem is reported through the callback.
class CardProcessor {
 public:
  CardProcessor(votergrid::ocr::FieldExtractor& extractor, FaceOptions face,
                CardIssueCallback on_issue = {},
                votergrid::core::StageTimingCallback on_stage_timing = {});

  /// Serial is left at 0; the coordinator assigns it.
  [[nodiscard]] votergrid::core::VoterRecord process(const votergrid::core::CardImage& card) const;

 private:
  void report(const votergrid::core::CardCell& cell, votergrid::core::PipelineError error) const;

  votergrid::ocr::FieldExtractor* extractor_;
  FaceOptions face_;
  CardIssueCallback on_issue_;
  votergrid::core::StageTimingCallback on_stage_timing_;
};

}  // namespace votergrid::app
