#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/report/report.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace votergrid::report {

/// Called for each row whose thumbnail the spreadsheet library refused
/// (serial, reason). The row is still written with an empty photo cell.
using ImageIssueCallback = std::function<void(std::uint32_t serial, const std::string& reason)>;

/// Renders a Report as an .xlsx workbook with libxlsxwriter.
///
/// One worksheet: a bold header row, then one row per record. Serial is a
/// number; every other field is a text cell ("@" format) so that IDs, ages and
/// house numbers keep their leading zeros. Stateless; write() may be called
/// from several threads with different reports.
class XlsxWriter {
 public:
  explicit XlsxWriter(ImageIssueCallback on_image_issue = {});

  /// Workbook bytes (a zip archive). ReportFailed if the workbook cannot be built.
  [[nodiscard]] std::expected<std::vector<std::byte>, votergrid::core::PipelineError> write(
      const Report& report) const;

  /// write() then store the bytes at \p path. ReportFailed on any I/O error.
  [[nodiscard]] std::expected<void, votergrid::core::PipelineError> write_file(
      const Report& report, const std::string& path) const;

 private:
  ImageIssueCallback on_image_issue_;
};

}  // namespace votergrid::report
