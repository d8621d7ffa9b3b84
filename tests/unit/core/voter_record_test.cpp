#include <votergrid/core/error.hpp>
#include <votergrid/core/voter_record.hpp>
#include <gtest/gtest.h>

namespace vc = votergrid::core;

TEST(VoterRecord, DefaultFieldsAllAbsent) {
  vc::VoterFields f;
  EXPECT_TRUE(f.all_absent());
  EXPECT_EQ(f.gender, vc::Gender::Unknown);
  f.age = "42";
  EXPECT_FALSE(f.all_absent());
}

TEST(VoterRecord, KnownGenderIsNotAbsent) {
  vc::VoterFields f;
  f.gender = vc::Gender::Female;
  EXPECT_FALSE(f.all_absent());
}

TEST(VoterRecord, GenderLabelsAreBilingual) {
  EXPECT_EQ(vc::gender_label(vc::Gender::Male), "पुरुष / Male");
  EXPECT_EQ(vc::gender_label(vc::Gender::Female), "महिला / Female");
  EXPECT_EQ(vc::gender_label(vc::Gender::Other), "इतर / Other");
  EXPECT_TRUE(vc::gender_label(vc::Gender::Unknown).empty());
}

TEST(VoterRecord, GenderNames) {
  EXPECT_EQ(vc::gender_name(vc::Gender::Male), "male");
  EXPECT_EQ(vc::gender_name(vc::Gender::Unknown), "unknown");
}

TEST(PipelineError, EveryCodeHasMessage) {
  for (auto e : {vc::PipelineError::None, vc::PipelineError::InvalidFrame,
                 vc::PipelineError::LoadFailed, vc::PipelineError::InvalidGrid,
                 vc::PipelineError::SegmentationFailed, vc::PipelineError::NoCards,
                 vc::PipelineError::OcrEngineFailed, vc::PipelineError::NoTextRecognized,
                 vc::PipelineError::InvalidConfig, vc::PipelineError::ReportFailed}) {
    EXPECT_FALSE(vc::to_string(e).empty());
    EXPECT_NE(vc::to_string(e), "unknown error");
  }
}
