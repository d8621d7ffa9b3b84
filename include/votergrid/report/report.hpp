#pragma once

#include <votergrid/core/voter_record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace votergrid::report {

/// Fixed column order of the voter sheet.
enum class Column : std::uint8_t {
  Serial,
  VoterId,
  Name,
  RelativeName,
  HouseNo,
  Age,
  Gender,
  Photo,
};

inline constexpr std::size_t kColumnCount = 8;

struct ReportColumn {
  Column id{Column::Serial};
  std::string header;  // bilingual, UTF-8
  double width{10.0};  // spreadsheet character units
};

/// Presentation settings shared by the assembler and the writer.
struct ReportLayout {
  std::uint32_t thumbnail_width{80};  // display width in pixels
  std::uint32_t image_padding{2};     // pixels between the cell border and the thumbnail
  double default_row_height{15.0};    // points
  double header_row_height{30.0};     // points
  std::string font_name{"Mangal"};
  double font_size{11.0};
  std::string sheet_name{"Voters"};
};

/// PNG of one face plus the scale that shows it at the display size.
struct Thumbnail {
  std::vector<std::uint8_t> png;
  std::uint32_t source_width{0};
  std::uint32_t source_height{0};
  std::uint32_t display_width{0};
  std::uint32_t display_height{0};

  [[nodiscard]] double x_scale() const noexcept {
    return source_width ? static_cast<double>(display_width) / source_width : 1.0;
  }
  [[nodiscard]] double y_scale() const noexcept {
    return source_height ? static_cast<double>(display_height) / source_height : 1.0;
  }
};

struct ReportRow {
  votergrid::core::VoterRecord record;
  double height_points{15.0};
  std::optional<Thumbnail> thumbnail;
};

/// Spreadsheet-independent report: columns, then one row per record in serial order.
struct Report {
  ReportLayout layout;
  std::vector<ReportColumn> columns;
  std::vector<ReportRow> rows;
};

/// The eight bilingual columns with their widths.
[[nodiscard]] std::vector<ReportColumn> default_columns();

/// Pixel to point conversion used for row heights (96 dpi screen).
[[nodiscard]] constexpr double points_from_pixels(double px) noexcept { return px * 0.75; }

/// Display size of a source_width x source_height face at \p thumbnail_width,
/// keeping the aspect ratio: height = round(source_height * width / source_width).
[[nodiscard]] std::uint32_t thumbnail_height(std::uint32_t source_width,
                                             std::uint32_t source_height,
                                             std::uint32_t thumbnail_width) noexcept;

/// Builds the report. Records are ordered by serial; each face is encoded as PNG
/// and sized so that the row is at least as tall as the scaled image. A face that
/// cannot be encoded leaves that row without a thumbnail.
[[nodiscard]] Report assemble(std::vector<votergrid::core::VoterRecord> records,
                              ReportLayout layout = {});

/// Text of one cell; empty for an absent field and for the photo column.
[[nodiscard]] std::string cell_text(const votergrid::core::VoterRecord& record, Column column);

/// How a cell is stored in the workbook.
enum class CellKind {
  Number,  // the serial only
  Text,    // "@" format: IDs, ages and house numbers keep leading zeros
  Blank,   // absent field
  Image,   // photo column with a thumbnail
};

[[nodiscard]] CellKind cell_kind(const ReportRow& row, Column column);

}  // namespace votergrid::report
