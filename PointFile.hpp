#ifndef POINT_FILE_HPP__
#define POINT_FILE_HPP__

#include <system_error>
#include <QChar>
#include <QPolygonF>
#include <QTextStream>

namespace PointFile
{
  enum class Error
  {
    malformed_point       = -2001,
    non_finite_coordinate = -2002,
    write_failed          = -2003
  };

  std::error_category const & category() noexcept;

  // Read a polyline, one point per line, two coordinates separated by
  // whitespace, a comma, or a semicolon. Blank lines and lines starting
  // with '#' are skipped. On failure, the polygon is left as it was and,
  // if requested, the 1-based number of the offending line is returned.

  std::error_code
  read(QTextStream & stream,
       QPolygonF   & polygon,
       qsizetype   * line = nullptr);

  // Write a polyline, one point per line, coordinates separated by the
  // delimiter, formatted to the requested number of significant digits.

  std::error_code
  write(QTextStream     & stream,
        QPolygonF const & polygon,
        QChar             delimiter = QLatin1Char(' '),
        int               precision = 10);
}

namespace std
{
  template<>
  struct is_error_code_enum<PointFile::Error> : public true_type{};
}

namespace PointFile
{
  inline std::error_code
  make_error_code(Error const e) noexcept
  {
    return {static_cast<int>(e), category()};
  }
}

#endif
