#include <system_error>
#include <gtest/gtest.h>
#include <QBuffer>
#include <QPolygonF>
#include <QString>
#include <QTextStream>
#include "PointFile.hpp"

namespace
{
  std::error_code
  readText(QString     text,
           QPolygonF & polygon,
           qsizetype * line = nullptr)
  {
    QTextStream stream {&text, QIODevice::ReadOnly};
    return PointFile::read(stream, polygon, line);
  }
}

/******************************************************************************/
// Reading
/******************************************************************************/

TEST(PointFile, ReadsAllSeparators)
{
  QPolygonF polygon;

  auto const ec = readText("0 0\n"
                           "1,2\n"
                           "3, 4\n"
                           "5;6\n"
                           "\t7\t  8  \n"
                           "-1.5e2 0.25\n", polygon);

  EXPECT_FALSE(ec);
  EXPECT_EQ(polygon, (QPolygonF{QList<QPointF>{{0, 0}, {1, 2}, {3, 4}, {5, 6}, {7, 8}, {-150, 0.25}}}));
}

TEST(PointFile, SkipsBlankAndCommentLines)
{
  QPolygonF polygon;
  qsizetype line = -1;

  auto const ec = readText("# track\n"
                           "\n"
                           "1 1\n"
                           "   \n"
                           "  # comment\n"
                           "2 2", polygon, &line);

  EXPECT_FALSE(ec);
  EXPECT_EQ(line, 0);
  EXPECT_EQ(polygon, (QPolygonF{QList<QPointF>{{1, 1}, {2, 2}}}));
}

TEST(PointFile, EmptyInputIsEmptyPolyline)
{
  QPolygonF polygon {QList<QPointF>{{9, 9}}};

  EXPECT_FALSE(readText("", polygon));
  EXPECT_TRUE(polygon.isEmpty());
}

TEST(PointFile, MalformedPointReportsLine)
{
  for (auto const & bad : {"1\n", "1 2 3\n", "x 2\n", "1 y\n"})
  {
    QPolygonF  polygon {QList<QPointF>{{9, 9}}};
    qsizetype  line = 0;
    auto const ec   = readText(QString("0 0\n# ok\n") + bad, polygon, &line);

    EXPECT_EQ(ec, PointFile::Error::malformed_point) << bad;
    EXPECT_EQ(line, 3) << bad;
    EXPECT_EQ(polygon, (QPolygonF{QList<QPointF>{{9, 9}}})) << bad;
  }
}

TEST(PointFile, NonFiniteCoordinateIsRejected)
{
  for (auto const & bad : {"nan 1\n", "1 inf\n", "-inf 0\n"})
  {
    QPolygonF  polygon;
    qsizetype  line = 0;
    auto const ec   = readText(QString(bad), polygon, &line);

    EXPECT_EQ(ec, PointFile::Error::non_finite_coordinate) << bad;
    EXPECT_EQ(line, 1) << bad;
    EXPECT_TRUE(polygon.isEmpty()) << bad;
  }
}

/******************************************************************************/
// Writing
/******************************************************************************/

TEST(PointFile, WritesWithDelimiterAndPrecision)
{
  QString     text;
  QTextStream stream {&text, QIODevice::WriteOnly};

  auto const ec = PointFile::write(stream,
                                   QPolygonF{QList<QPointF>{{0, 0}, {1.23456, -7.5}, {1e20, 2}}},
                                   QLatin1Char(','),
                                   3);

  EXPECT_FALSE(ec);
  EXPECT_EQ(text, "0,0\n1.23,-7.5\n1e+20,2\n");
}

TEST(PointFile, WrittenPointsReadBack)
{
  QPolygonF const original {QList<QPointF>{{0.1, 0.2}, {1.0 / 3, 2.0 / 3}, {-1e-9, 12345.678}}};
  QString         text;
  QTextStream     stream {&text, QIODevice::WriteOnly};

  ASSERT_FALSE(PointFile::write(stream, original, QLatin1Char(' '), 17));

  QPolygonF polygon;

  ASSERT_FALSE(readText(text, polygon));
  EXPECT_EQ(polygon, original);
}

TEST(PointFile, WriteFailureIsReported)
{
  QBuffer buffer;
  buffer.open(QIODevice::ReadOnly);

  QTextStream stream {&buffer};

  EXPECT_EQ(PointFile::write(stream, QPolygonF{QList<QPointF>{{1, 2}}}),
            PointFile::Error::write_failed);
}

/******************************************************************************/
// Category
/******************************************************************************/

TEST(PointFile, CategoryDescribesErrors)
{
  std::error_code const ec = PointFile::Error::malformed_point;

  EXPECT_STREQ(ec.category().name(), "pointfile");
  EXPECT_EQ(ec.message(), "malformed point");
  EXPECT_EQ(std::error_code(PointFile::Error::non_finite_coordinate).message(), "non-finite coordinate");
  EXPECT_EQ(std::error_code(PointFile::Error::write_failed).message(), "write failed");
  EXPECT_EQ(&ec.category(), &PointFile::category());
}
