#include <votergrid/report/report.hpp>
#include <votergrid/vision/image_io.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace votergrid::report {

namespace vc = votergrid::core;

std::vector<ReportColumn> default_columns() {
  return {
      {Column::Serial, "अ.क्र. / S.No.", 8.0},
      {Column::VoterId, "मतदार ओळखपत्र / Voter ID", 24.0},
      {Column::Name, "मतदाराचे पूर्ण नाव / Name", 32.0},
      {Column::RelativeName, "नातेवाईकाचे नाव / Relative Name", 32.0},
      {Column::HouseNo, "घर क्रमांक / House No.", 14.0},
      {Column::Age, "वय / Age", 8.0},
      {Column::Gender, "लिंग / Gender", 16.0},
      {Column::Photo, "छायाचित्र / Photo", 13.0},
  };
}

std::uint32_t thumbnail_height(std::uint32_t source_width, std::uint32_t source_height,
                               std::uint32_t thumbnail_width) noexcept {
  if (source_width == 0) return 0;
  const double h = static_cast<double>(source_height) * thumbnail_width / source_width;
  return static_cast<std::uint32_t>(std::lround(h));
}

namespace {

std::optional<Thumbnail> make_thumbnail(const vc::Frame& face, std::uint32_t width) {
  if (face.empty() || width == 0) return std::nullopt;
  auto png = votergrid::vision::encode_png(face);
  if (!png) return std::nullopt;

  Thumbnail t;
  t.png = std::move(*png);
  t.source_width = face.width();
  t.source_height = face.height();
  t.display_width = width;
  t.display_height = thumbnail_height(face.width(), face.height(), width);
  return t;
}

}  // namespace

Report assemble(std::vector<vc::VoterRecord> records, ReportLayout layout) {
  std::stable_sort(records.begin(), records.end(),
                   [](const vc::VoterRecord& a, const vc::VoterRecord& b) {
                     return a.serial < b.serial;
                   });

  Report report;
  report.layout = std::move(layout);
  report.columns = default_columns();
  report.rows.reserve(records.size());

  for (auto& record : records) {
    ReportRow row;
    row.height_points = report.layout.default_row_height;
    if (record.face_image) {
      row.thumbnail = make_thumbnail(*record.face_image, report.layout.thumbnail_width);
      // The pixels now live in the PNG.
      record.face_image.reset();
    }
    if (row.thumbnail) {
      const std::uint32_t padded = row.thumbnail->display_height + 2 * report.layout.image_padding;
      row.height_points = std::max(row.height_points, points_from_pixels(padded));
    }
    row.record = std::move(record);
    report.rows.push_back(std::move(row));
  }
  return report;
}

std::string cell_text(const vc::VoterRecord& record, Column column) {
  const auto& f = record.fields;
  switch (column) {
    case Column::Serial:
      return std::to_string(record.serial);
    case Column::VoterId:
      return f.voter_id.value_or(std::string{});
    case Column::Name:
      return f.name.value_or(std::string{});
    case Column::RelativeName:
      return f.relative_name.value_or(std::string{});
    case Column::HouseNo:
      return f.house_no.value_or(std::string{});
    case Column::Age:
      return f.age.value_or(std::string{});
    case Column::Gender:
      return std::string(vc::gender_label(f.gender));
    case Column::Photo:
      return {};
  }
  return {};
}

CellKind cell_kind(const ReportRow& row, Column column) {
  switch (column) {
    case Column::Serial:
      return CellKind::Number;
    case Column::Photo:
      return row.thumbnail ? CellKind::Image : CellKind::Blank;
    default:
      return cell_text(row.record, column).empty() ? CellKind::Blank : CellKind::Text;
  }
}

}  // namespace votergrid::report
