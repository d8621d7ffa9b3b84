#include <votergrid/report/xlsx_writer.hpp>
#include <xlsxwriter.h>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <utility>

namespace votergrid::report {

namespace vc = votergrid::core;

namespace {

/// Owns a workbook until workbook_close() takes it over.
struct WorkbookDeleter {
  void operator()(lxw_workbook* wb) const noexcept { lxw_workbook_free(wb); }
};
using WorkbookPtr = std::unique_ptr<lxw_workbook, WorkbookDeleter>;

struct BufferDeleter {
  void operator()(const char* p) const noexcept { std::free(const_cast<char*>(p)); }
};

struct Formats {
  lxw_format* header{nullptr};
  lxw_format* text{nullptr};
  lxw_format* number{nullptr};
};

Formats make_formats(lxw_workbook* wb, const ReportLayout& layout) {
  Formats f;
  f.header = workbook_add_format(wb);
  format_set_font_name(f.header, layout.font_name.c_str());
  format_set_font_size(f.header, layout.font_size);
  format_set_bold(f.header);
  format_set_text_wrap(f.header);
  format_set_align(f.header, LXW_ALIGN_CENTER);
  format_set_align(f.header, LXW_ALIGN_VERTICAL_CENTER);
  format_set_border(f.header, LXW_BORDER_THIN);

  f.text = workbook_add_format(wb);
  format_set_font_name(f.text, layout.font_name.c_str());
  format_set_font_size(f.text, layout.font_size);
  format_set_num_format(f.text, "@");
  format_set_align(f.text, LXW_ALIGN_VERTICAL_CENTER);
  format_set_border(f.text, LXW_BORDER_THIN);

  f.number = workbook_add_format(wb);
  format_set_font_name(f.number, layout.font_name.c_str());
  format_set_font_size(f.number, layout.font_size);
  format_set_align(f.number, LXW_ALIGN_CENTER);
  format_set_align(f.number, LXW_ALIGN_VERTICAL_CENTER);
  format_set_border(f.number, LXW_BORDER_THIN);
  return f;
}

}  // namespace

XlsxWriter::XlsxWriter(ImageIssueCallback on_image_issue)
    : on_image_issue_(std::move(on_image_issue)) {}

std::expected<std::vector<std::byte>, vc::PipelineError> XlsxWriter::write(
    const Report& report) const {
  const char* buffer = nullptr;
  std::size_t buffer_size = 0;
  lxw_workbook_options options{};
  options.output_buffer = &buffer;
  options.output_buffer_size = &buffer_size;

  WorkbookPtr wb(workbook_new_opt(nullptr, &options));
  if (!wb) return std::unexpected(vc::PipelineError::ReportFailed);

  lxw_worksheet* ws = workbook_add_worksheet(wb.get(), report.layout.sheet_name.c_str());
  if (!ws) return std::unexpected(vc::PipelineError::ReportFailed);
  const Formats fmt = make_formats(wb.get(), report.layout);

  // Header row.
  for (std::size_t c = 0; c < report.columns.size(); ++c) {
    const auto col = static_cast<lxw_col_t>(c);
    const ReportColumn& column = report.columns[c];
    worksheet_set_column(ws, col, col, column.width, nullptr);
    if (worksheet_write_string(ws, 0, col, column.header.c_str(), fmt.header) != LXW_NO_ERROR) {
      return std::unexpected(vc::PipelineError::ReportFailed);
    }
  }
  worksheet_set_row(ws, 0, report.layout.header_row_height, nullptr);
  worksheet_freeze_panes(ws, 1, 0);

  for (std::size_t r = 0; r < report.rows.size(); ++r) {
    const ReportRow& row = report.rows[r];
    const auto xl_row = static_cast<lxw_row_t>(r + 1);
    worksheet_set_row(ws, xl_row, row.height_points, nullptr);

    for (std::size_t c = 0; c < report.columns.size(); ++c) {
      const auto col = static_cast<lxw_col_t>(c);
      const Column id = report.columns[c].id;
      lxw_error err = LXW_NO_ERROR;

      switch (cell_kind(row, id)) {
        case CellKind::Number:
          err = worksheet_write_number(ws, xl_row, col, row.record.serial, fmt.number);
          break;
        case CellKind::Text:
          err = worksheet_write_string(ws, xl_row, col, cell_text(row.record, id).c_str(), fmt.text);
          break;
        case CellKind::Blank:
          err = worksheet_write_blank(ws, xl_row, col, fmt.text);
          break;
        case CellKind::Image: {
          err = worksheet_write_blank(ws, xl_row, col, fmt.text);
          if (err != LXW_NO_ERROR) break;
          const Thumbnail& t = *row.thumbnail;
          lxw_image_options image{};
          image.x_offset = static_cast<std::int32_t>(report.layout.image_padding);
          image.y_offset = static_cast<std::int32_t>(report.layout.image_padding);
          image.x_scale = t.x_scale();
          image.y_scale = t.y_scale();
          const lxw_error img_err = worksheet_insert_image_buffer_opt(
              ws, xl_row, col, t.png.data(), t.png.size(), &image);
          if (img_err != LXW_NO_ERROR && on_image_issue_) {
            on_image_issue_(row.record.serial, lxw_strerror(img_err));
          }
          break;
        }
      }
      if (err != LXW_NO_ERROR) return std::unexpected(vc::PipelineError::ReportFailed);
    }
  }

  // workbook_close() frees the workbook whatever it returns.
  const lxw_error close_err = workbook_close(wb.release());
  std::unique_ptr<const char, BufferDeleter> owned(buffer);
  if (close_err != LXW_NO_ERROR || !buffer || buffer_size == 0) {
    return std::unexpected(vc::PipelineError::ReportFailed);
  }

  const auto* first = reinterpret_cast<const std::byte*>(buffer);
  return std::vector<std::byte>(first, first + buffer_size);
}

std::expected<void, vc::PipelineError> XlsxWriter::write_file(const Report& report,
                                                              const std::string& path) const {
  auto bytes = write(report);
  if (!bytes) return std::unexpected(bytes.error());

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return std::unexpected(vc::PipelineError::ReportFailed);
  out.write(reinterpret_cast<const char*>(bytes->data()),
            static_cast<std::streamsize>(bytes->size()));
  if (!out) return std::unexpected(vc::PipelineError::ReportFailed);
  return {};
}

}  // namespace votergrid::report
