#ifndef RDP_HPP__
#define RDP_HPP__

#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <QBitArray>
#include <QList>
#include <QPair>
#include <QPolygonF>
#include <QStack>
#include <QString>

namespace RDP
{
  // Exception thrown when handed something we can't work with at all,
  // i.e., a null sequence or a missing coordinate accessor. That's a
  // programming error on the part of the caller, and we'd rather say
  // so than quietly return nothing.

  struct error : public std::runtime_error
  {
    explicit error(QString const & what)
    : std::runtime_error(what.toStdString())
    {}
  };

  // Returns true if the tolerance is one we're able to simplify with. Any
  // tolerance that isn't a finite, positive value is taken to mean that
  // nothing should be removed; it's not an error.

  inline bool
  simplifiable(qreal const epsilon) noexcept
  {
    return std::isfinite(epsilon) && epsilon > 0;
  }

  namespace detail
  {
    using Span  = QPair<qsizetype, qsizetype>;
    using Stack = QStack<Span>;

    // Accessors are invoked, so anything std::invoke() can handle will do;
    // lambdas, function pointers, std::function, and pointers to members
    // such as &QPointF::x.

    template <typename T,
              typename Accessor>
    inline qreal
    coordinate(Accessor const & accessor,
               T        const & point)
    {
      return static_cast<qreal>(std::invoke(accessor, point));
    }

    // Determine if an accessor is absent; only things that are able to be
    // null can be, e.g., function pointers, member pointers and an empty
    // std::function. A lambda is never absent.

    template <typename Accessor>
    constexpr bool
    absent(Accessor const & accessor) noexcept
    {
      if constexpr (std::is_pointer_v<Accessor> ||
                    std::is_member_pointer_v<Accessor>)
      {
        return accessor == nullptr;
      }
      else if constexpr (std::is_constructible_v<bool, Accessor const &>)
      {
        return !static_cast<bool>(accessor);
      }
      else
      {
        return false;
      }
    }

    template <typename GetX,
              typename GetY>
    void
    require(GetX const & getX,
            GetY const & getY)
    {
      if (absent(getX)) throw error(QStringLiteral("X coordinate accessor is absent"));
      if (absent(getY)) throw error(QStringLiteral("Y coordinate accessor is absent"));
    }

    // Ramer–Douglas–Peucker; on completion, the array will have a bit set
    // for every point that should be kept. Caller must have verified that
    // there are at least 3 points and a usable tolerance.
    //
    // Rather than recursing, we run a stack machine over spans of indices,
    // so the depth of the native stack doesn't depend on the shape of the
    // input. Both the array and the stack are supplied by the caller, who
    // may reuse them; we'll reset them here.
    //
    // Distances are all compared squared; we never need a square root.

    template <typename T,
              typename GetX,
              typename GetY>
    void
    mark(T         const * const points,
         qsizetype         const size,
         qreal             const epsilon,
         GetX      const &       getX,
         GetY      const &       getY,
         QBitArray       &       array,
         Stack           &       stack)
    {
      auto const epsilonSquared = epsilon * epsilon;

      // We're always going to keep the first and last points; all others
      // are initially in play. Prime the stack with the full span.

      array.fill(false, size);
      array.setBit(0);
      array.setBit(size - 1);
      stack.clear();
      stack.push({0, size - 1});

      while (!stack.isEmpty())
      {
        auto const [
          index1,
          index2
        ] = stack.pop();

        // Nothing between the endpoints; nothing to do.

        if (index2 - index1 < 2) continue;

        // Create a theoretical line between the first and last points
        // in the span we're presently considering; compute the vector
        // components and the squared line length.

        auto const x1 = coordinate(getX, points[index1]);
        auto const y1 = coordinate(getY, points[index1]);
        auto const x2 = coordinate(getX, points[index2]);
        auto const y2 = coordinate(getY, points[index2]);
        auto const dx = x2 - x1;
        auto const dy = y2 - y1;
        auto const ll = dx * dx + dy * dy;

        // Find the point within the span at the largest distance from the
        // line. First one found wins a tie.

        qreal     dMax  = 0;
        qsizetype index = index1;

        if (ll < std::numeric_limits<qreal>::denorm_min())
        {
          // Endpoints are coincident, so there's no line to speak of; use
          // the distance from the anchor point instead.

          for (auto i = index1 + 1; i < index2; ++i)
          {
            auto const px = coordinate(getX, points[i]) - x1;
            auto const py = coordinate(getY, points[i]) - y1;
            auto const d  = px * px + py * py;

            if (d > dMax)
            {
              index = i;
              dMax  = d;
            }
          }
        }
        else
        {
          auto const cross = x1 * y2 - x2 * y1;

          for (auto i = index1 + 1; i < index2; ++i)
          {
            auto const n = cross + dx * coordinate(getY, points[i])
                                 - dy * coordinate(getX, points[i]);
            auto const d = n * n / ll;

            if (d > dMax)
            {
              index = i;
              dMax  = d;
            }
          }
        }

        // If the farthest point is outside the tolerance, that's our point.
        // Keep it and break the span into two spans at it. The left span is
        // pushed last so that it's worked first.

        if (dMax > epsilonSquared)
        {
          array.setBit(index);
          stack.push({index, index2});
          stack.push({index1, index});
        }
      }
    }
  }

  // Simplify the polyline described by the sequence of points, returning
  // a new sequence containing, in their original order, only the points
  // that the Ramer–Douglas–Peucker algorithm considers significant at the
  // requested tolerance. The first and last points are always kept.
  //
  // Points may be of any type; coordinates are obtained by way of the
  // accessors, which will be called many times per point, so they should
  // be cheap. Points themselves are copied, never constructed.
  //
  // Sequences of fewer than 3 points, and tolerances that aren't finite
  // and positive, result in a copy of the input.
  //
  // Throws RDP::error if the points pointer is null with a non-zero size,
  // if the size is negative, or if either accessor is absent. A null
  // pointer with a size of zero is an empty sequence, not an error.

  template <typename T,
            typename GetX,
            typename GetY>
  QList<T>
  simplify(T    const * const points,
           qsizetype    const size,
           qreal        const epsilon,
           GetX         const getX,
           GetY         const getY)
  {
    if (size < 0)        throw error(QStringLiteral("Point count %1 is negative").arg(size));
    if (!points && size) throw error(QStringLiteral("Point sequence is absent"));

    detail::require(getX, getY);

    if (size < 3 || !simplifiable(epsilon)) return QList<T>(points, points + size);

    QBitArray     array;
    detail::Stack stack;

    detail::mark(points, size, epsilon, getX, getY, array, stack);

    QList<T> result;
    result.reserve(array.count(true));

    for (qsizetype i = 0; i < size; ++i)
    {
      if (array.testBit(i)) result.append(points[i]);
    }

    return result;
  }

  template <typename T,
            typename GetX,
            typename GetY>
  QList<T>
  simplify(QList<T> const & points,
           qreal    const   epsilon,
           GetX     const   getX,
           GetY     const   getY)
  {
    detail::require(getX, getY);

    if (points.size() < 3 || !simplifiable(epsilon)) return points;

    return simplify(points.constData(), points.size(), epsilon, getX, getY);
  }

  // Convenience for Qt's own polyline type.

  QPolygonF
  simplify(QPolygonF const & polygon,
           qreal             epsilon);

  // In-place variant of simplify() for QPolygonF. Retained points are
  // shifted, in order, to the front of the polygon, and the returned
  // iterator marks the first discarded slot, so the caller trims with
  //
  //   RDP::Reducer reduce;
  //
  //   polygon.erase(reduce(polygon, epsilon), polygon.end());
  //
  // Slots from the iterator to the end hold moved-from points. Inputs
  // simplify() would return unchanged yield end().
  //
  // The span stack and retention bits live in the object and are
  // reused from call to call. One caller at a time.

  class Reducer
  {
    detail::Stack stack;
    QBitArray     array;

  public:

    QPolygonF::iterator
    operator()(QPolygonF & polygon,
               qreal       epsilon);
  };
}

#endif
