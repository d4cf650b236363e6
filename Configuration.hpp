#ifndef CONFIGURATION_HPP__
#define CONFIGURATION_HPP__

#include <memory>
#include <QChar>
#include <QtGlobal>

class QSettings;

//
// Class Configuration
//
//  Encapsulates the persistent defaults used by the tools; the
//  tolerance to simplify with, and the formatting of written points.
//
// Responsibilities
//
//  Settings are read once, on construction, from the supplied QSettings
//  database, which must outlive us. Default values for settings not yet
//  present are established there and nowhere else.
//
//  Changes made through the setters are written back to the settings
//  database immediately.
//
class Configuration final
{
public:

  explicit Configuration(QSettings * settings);
  ~Configuration();

  // Accessors

  qreal epsilon()   const;
  int   precision() const;
  QChar delimiter() const;

  // Setters; precision is clamped to the range that's meaningful for
  // a double.

  void setEpsilon(qreal);
  void setPrecision(int);
  void setDelimiter(QChar);

  // Range of significant digits we'll use for output.

  static constexpr int MinPrecision =  1;
  static constexpr int MaxPrecision = 17;

private:

  class           impl;
  std::unique_ptr<impl> m_;
};

#endif
