#include "RDP.hpp"
#include <utility>

/******************************************************************************/
// Public Implementation
/******************************************************************************/

namespace RDP
{
  QPolygonF
  simplify(QPolygonF const & polygon,
           qreal     const   epsilon)
  {
    return simplify(polygon, epsilon, &QPointF::x, &QPointF::y);
  }

  // Same retention as simplify(), but compacted into the polygon's own
  // storage; the polygon never grows, so nothing is allocated beyond the
  // buffers we hold.

  QPolygonF::iterator
  Reducer::operator()(QPolygonF & polygon,
                      qreal const epsilon)
  {
    // Short polygons and unusable tolerances are left alone.

    if (polygon.size() < 3 || !simplifiable(epsilon)) return polygon.end();

    detail::mark(polygon.constData(),
                 polygon.size(),
                 epsilon,
                 &QPointF::x,
                 &QPointF::y,
                 array,
                 stack);

    // mark() has set a bit for each retained point; compact them.

    auto first = polygon.begin();

    for (qsizetype i = 0; i < polygon.size(); ++i)
    {
      if (array.testBit(i)) *first++ = std::move(polygon[i]);
    }

    return first;
  }
}

/******************************************************************************/
