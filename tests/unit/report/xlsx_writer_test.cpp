#include <votergrid/core/frame.hpp>
#include <votergrid/core/voter_record.hpp>
#include <votergrid/report/report.hpp>
#include <votergrid/report/xlsx_writer.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <vector>

namespace vc = votergrid::core;
namespace vr = votergrid::report;

namespace {

vr::Report make_report(std::size_t n) {
  std::vector<vc::VoterRecord> records;
  for (std::size_t i = 0; i < n; ++i) {
    vc::VoterRecord r;
    r.serial = static_cast<std::uint32_t>(i + 1);
    r.fields.voter_id = "ABC1234567 12/34/567";
    r.fields.name = "सुनील पाटील";
    r.fields.house_no = "007";
    r.fields.gender = i % 2 ? vc::Gender::Female : vc::Gender::Male;
    std::vector<std::byte> buf(40 * 60 * 3, std::byte{static_cast<unsigned char>(20 * i)});
    r.face_image = vc::Frame(40, 60, vc::PixelFormat::RGB8, std::move(buf));
    records.push_back(std::move(r));
  }
  return vr::assemble(std::move(records));
}

bool is_zip(const std::vector<std::byte>& bytes) {
  return bytes.size() > 4 && bytes[0] == std::byte{'P'} && bytes[1] == std::byte{'K'};
}

}  // namespace

TEST(XlsxWriter, WritesZipWorkbook) {
  const vr::XlsxWriter writer;
  auto bytes = writer.write(make_report(3));
  ASSERT_TRUE(bytes.has_value());
  EXPECT_TRUE(is_zip(*bytes));
}

TEST(XlsxWriter, EmptyReportStillHasHeader) {
  const vr::XlsxWriter writer;
  auto bytes = writer.write(vr::assemble({}));
  ASSERT_TRUE(bytes.has_value());
  EXPECT_TRUE(is_zip(*bytes));
}

TEST(XlsxWriter, RejectedImageLeavesReportIntact) {
  vr::Report report = make_report(2);
  ASSERT_TRUE(report.rows[0].thumbnail.has_value());
  report.rows[0].thumbnail->png = {1, 2, 3, 4};  // not an image
  std::vector<std::uint32_t> rejected;
  const vr::XlsxWriter writer([&rejected](std::uint32_t serial, const std::string&) {
    rejected.push_back(serial);
  });
  auto bytes = writer.write(report);
  ASSERT_TRUE(bytes.has_value());
  EXPECT_TRUE(is_zip(*bytes));
  EXPECT_EQ(rejected, (std::vector<std::uint32_t>{1}));
}

TEST(XlsxWriter, WriteFile) {
  const auto path = std::filesystem::temp_directory_path() / "votergrid_xlsx_writer_test.xlsx";
  const vr::XlsxWriter writer;
  ASSERT_TRUE(writer.write_file(make_report(1), path.string()).has_value());
  EXPECT_GT(std::filesystem::file_size(path), 0u);
  std::filesystem::remove(path);

  auto bad = writer.write_file(make_report(1), "/nonexistent-dir/out.xlsx");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), vc::PipelineError::ReportFailed);
}
