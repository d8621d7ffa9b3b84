#include <votergrid/app/card_processor.hpp>
#include <votergrid/vision/enhance_stage.hpp>
#include <votergrid/vision/face_cropper.hpp>
#include <utility>

namespace votergrid::app {

namespace vc = votergrid::core;

CardProcessor::CardProcessor(votergrid::ocr::FieldExtractor& extractor, FaceOptions face,
                             CardIssueCallback on_issue,
                             vc::StageTimingCallback on_stage_timing)
    : extractor_(&extractor),
      face_(face),
      on_issue_(std::move(on_issue)),
      on_stage_timing_(std::move(on_stage_timing)) {}

void CardProcessor::report(const vc::CardCell& cell, vc::PipelineError error) const {
  if (on_issue_) on_issue_(cell, error);
}

vc::VoterRecord CardProcessor::process(const vc::CardImage& card) const {
  vc::VoterRecord record;
  record.row = card.row();
  record.col = card.col();

  auto extraction = extractor_->extract(card, on_stage_timing_ ? &on_stage_timing_ : nullptr);
  if (!extraction) {
    report(card.cell, extraction.error());
  } else {
    if (!extraction->text_found) report(card.cell, vc::PipelineError::NoTextRecognized);
    record.fields = std::move(extraction->fields);
  }

  // The face is cut from the original card, not the OCR-preprocessed copy.
  auto face = votergrid::vision::crop_face(card.image, face_.ratios);
  if (!face) {
    report(card.cell, face.error());
    return record;
  }
  if (face_.contrast == 1.0f && face_.sharpness == 1.0f) {
    record.face_image = std::move(*face);
    return record;
  }
  auto enhanced = votergrid::vision::enhance_frame(*face, face_.contrast, face_.sharpness);
  if (enhanced) {
    record.face_image = std::move(*enhanced);
  } else {
    report(card.cell, enhanced.error());
    record.face_image = std::move(*face);
  }
  return record;
}

}  // namespace votergrid::app
