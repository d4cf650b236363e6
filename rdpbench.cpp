#include <array>
#include <QCoreApplication>
#include <QDebug>
#include <QElapsedTimer>
#include <QRandomGenerator>
#include "RDP.hpp"

/******************************************************************************/
// Constants
/******************************************************************************/

namespace
{
  // Fixed seed, so that runs are comparable with one another.

  constexpr quint32 SEED = 42;

  // Number of times each case is run; the reported time is the mean.

  constexpr int ITERATIONS = 200;

  struct Case
  {
    qsizetype size;
    qreal     epsilon;
  };

  constexpr auto CASES = std::array
  {
    Case{  100,  1.0},
    Case{ 1000,  1.0},
    Case{10000,  1.0},
    Case{10000,  0.1},
    Case{10000, 10.0}
  };
}

/******************************************************************************/
// Local Utilities
/******************************************************************************/

namespace
{
  // Polyline walking steadily along x, with y uniformly distributed in
  // [0, 100); about as unfriendly to simplification as real data gets.

  auto
  generate(qsizetype const size)
  {
    QRandomGenerator random {SEED};
    QPolygonF        polygon;

    polygon.reserve(size);

    for (qsizetype i = 0; i < size; ++i)
    {
      polygon.append(QPointF(i, random.bounded(100.0)));
    }

    return polygon;
  }
}

/******************************************************************************/
// Main
/******************************************************************************/

int
main(int    argc,
     char * argv[])
{
  QCoreApplication app {argc, argv};

  for (auto const & [size, epsilon] : CASES)
  {
    auto const polygon = generate(size);

    QElapsedTimer timer;
    qsizetype     kept = 0;

    timer.start();

    for (int i = 0; i < ITERATIONS; ++i)
    {
      kept = RDP::simplify(polygon, epsilon).size();
    }

    auto const elapsed = timer.nsecsElapsed();

    qInfo() << "[RDP]" << size << "points at epsilon" << epsilon
            << ":" << elapsed / 1000.0 / ITERATIONS << "us per call,"
            << kept << "kept";
  }

  return 0;
}

/******************************************************************************/
