#include "PointFile.hpp"
#include <cmath>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

/******************************************************************************/
// Private Implementation
/******************************************************************************/

#pragma mark Private Implementation

namespace
{
  const struct final : public std::error_category
  {
    const char *
    name() const noexcept override
    {
      return "pointfile";
    }

    std::string
    message(int const ev) const override
    {
      using PointFile::Error;

      switch (static_cast<Error>(ev))
      {
        case Error::malformed_point:       return "malformed point";
        case Error::non_finite_coordinate: return "non-finite coordinate";
        case Error::write_failed:          return "write failed";

        default: return "point file error";
      }
    }
  }
  Category;

  // Coordinates may be separated by any run of whitespace, commas, and
  // semicolons, so "1 2", "1,2", "1, 2" and "1;2" are all the same point.

  QRegularExpression const SEPARATORS{QStringLiteral("[\\s,;]+")};
}

/******************************************************************************/
// Implementation
/******************************************************************************/

#pragma mark - Implementation

namespace PointFile
{
  std::error_category const &
  category() noexcept
  {
    return Category;
  }

  std::error_code
  read(QTextStream & stream,
       QPolygonF   & polygon,
       qsizetype   * const line)
  {
    QPolygonF points;
    qsizetype number = 0;
    QString   text;

    // Build into a local polygon, so that the caller's is untouched on
    // failure; on failure, let the caller know where, if they care.

    auto const fail = [&](Error const e)
    {
      if (line) *line = number;
      return make_error_code(e);
    };

    while (stream.readLineInto(&text))
    {
      ++number;

      auto const trimmed = text.trimmed();

      if (trimmed.isEmpty() || trimmed.startsWith(QLatin1Char('#'))) continue;

      auto const fields = trimmed.split(SEPARATORS, Qt::SkipEmptyParts);

      if (fields.size() != 2) return fail(Error::malformed_point);

      bool       xOk;
      bool       yOk;
      auto const x = fields[0].toDouble(&xOk);
      auto const y = fields[1].toDouble(&yOk);

      if (!xOk || !yOk)                          return fail(Error::malformed_point);
      if (!std::isfinite(x) || !std::isfinite(y)) return fail(Error::non_finite_coordinate);

      points.append(QPointF(x, y));
    }

    polygon.swap(points);
    if (line) *line = 0;

    return {};
  }

  std::error_code
  write(QTextStream     & stream,
        QPolygonF const & polygon,
        QChar     const   delimiter,
        int       const   precision)
  {
    for (auto const & point : polygon)
    {
      stream << QString::number(point.x(), 'g', precision)
             << delimiter
             << QString::number(point.y(), 'g', precision)
             << '\n';
    }

    stream.flush();

    return stream.status() == QTextStream::Ok
         ? std::error_code{}
         : make_error_code(Error::write_failed);
  }
}

/******************************************************************************/
