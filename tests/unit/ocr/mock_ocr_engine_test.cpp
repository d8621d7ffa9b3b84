#include <votergrid/core/frame.hpp>
#include <votergrid/ocr/mock_ocr_engine.hpp>
#include <votergrid/ocr/ocr_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace vc = votergrid::core;
namespace vo = votergrid::ocr;

namespace {

vc::Frame make_frame(std::uint32_t w = 32, std::uint32_t h = 16) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h, std::byte{0});
  return vc::Frame(w, h, vc::PixelFormat::Grayscale8, std::move(buf));
}

}  // namespace

TEST(MockOcrEngine, ReturnsConfiguredText) {
  vo::MockOcrEngine engine;
  engine.set_text("वय : 45");
  auto result = engine.recognize(make_frame());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->text, "वय : 45");
  EXPECT_EQ(result->language, "mock");
  EXPECT_EQ(engine.call_count(), 1u);
}

TEST(MockOcrEngine, RejectsEmptyFrame) {
  vo::MockOcrEngine engine;
  auto result = engine.recognize(vc::Frame{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), vc::PipelineError::InvalidFrame);
  EXPECT_FALSE(engine.validate_input(vc::Frame{}).has_value());
}

TEST(MockOcrEngine, ScriptSeesFrame) {
  vo::MockOcrEngine engine;
  engine.set_text("unused");
  engine.set_script([](const vc::Frame& f)
                        -> std::expected<vc::RecognizedText, vc::PipelineError> {
    if (f.width() > 40) return std::unexpected(vc::PipelineError::OcrEngineFailed);
    return vc::RecognizedText{"w" + std::to_string(f.width()), 70.f, "mock"};
  });
  EXPECT_EQ(engine.recognize(make_frame(32))->text, "w32");
  EXPECT_EQ(engine.recognize(make_frame(64)).error(), vc::PipelineError::OcrEngineFailed);
}

TEST(MockOcrEngine, ConcurrentCallsCounted) {
  vo::MockOcrEngine engine;
  engine.set_text("x");
  const vc::Frame frame = make_frame();
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 25; ++i) {
        auto r = engine.recognize(frame);
        EXPECT_TRUE(r.has_value());
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(engine.call_count(), 100u);
}

TEST(OcrStage, WrapsEngineText) {
  auto engine = std::make_shared<vo::MockOcrEngine>();
  engine->set_text("hello");
  vo::OcrStage stage(engine);
  auto out = stage.process(make_frame());
  ASSERT_TRUE(out.has_value());
  ASSERT_TRUE(std::holds_alternative<vc::RecognizedText>(*out));
  EXPECT_EQ(std::get<vc::RecognizedText>(*out).text, "hello");
}

TEST(OcrStage, NullEngineFails) {
  vo::OcrStage stage(nullptr);
  EXPECT_EQ(stage.process(make_frame()).error(), vc::PipelineError::OcrEngineFailed);
}
