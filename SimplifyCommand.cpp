#include "SimplifyCommand.hpp"
#include <cstdio>
#include <system_error>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QLoggingCategory>
#include <QScopedPointer>
#include <QSettings>
#include <QTextStream>
#include "Configuration.hpp"
#include "PointFile.hpp"
#include "RDP.hpp"

/******************************************************************************/
// Local Utilities
/******************************************************************************/

namespace
{
  // Name used to denote standard input or output in place of a path.

  constexpr auto STANDARD_STREAM = "-";

  // Open the named file, or the standard stream if the name is empty or
  // the conventional dash, in the requested mode. Errors are logged here;
  // the caller need only check the return value.

  bool
  openStream(QFile               & file,
             QString       const & name,
             FILE                * standard,
             QIODevice::OpenMode   mode)
  {
    if (name.isEmpty() || name == STANDARD_STREAM)
    {
      if (file.open(standard, mode)) return true;
    }
    else
    {
      file.setFileName(name);
      if (file.open(mode)) return true;
    }

    qCritical() << "[RDP]unable to open" << (name.isEmpty() ? STANDARD_STREAM : name) << file.errorString();
    return false;
  }
}

/******************************************************************************/
// Public Implementation
/******************************************************************************/

namespace SimplifyCommand
{
  Status
  run(QStringList const & arguments)
  {
    QCommandLineParser parser;

    parser.setApplicationDescription("Simplify a polyline with the Ramer-Douglas-Peucker algorithm.");
    parser.addPositionalArgument("input", "Input file, one point per line; standard input if absent or '-'.", "[input]");

    auto const helpOption = parser.addHelpOption();

    QCommandLineOption const outputOption    {{"o", "output"},    "Write to <file> rather than standard output.", "file"};
    QCommandLineOption const epsilonOption   {{"e", "epsilon"},   "Maximum perpendicular distance tolerance.",     "value"};
    QCommandLineOption const precisionOption {{"p", "precision"}, "Significant digits of written coordinates.",    "digits"};
    QCommandLineOption const delimiterOption {{"d", "delimiter"}, "Character separating written coordinates.",     "char"};
    QCommandLineOption const configOption    {{"c", "config"},    "Read settings from the INI <file>.",           "file"};
    QCommandLineOption const verboseOption   {{"v", "verbose"},   "Log progress and timing."};

    parser.addOptions({outputOption,
                       epsilonOption,
                       precisionOption,
                       delimiterOption,
                       configOption,
                       verboseOption});

    if (!parser.parse(arguments))
    {
      qCritical() << "[RDP]" << parser.errorText();
      return Usage;
    }

    if (parser.isSet(helpOption))
    {
      QTextStream(stdout) << parser.helpText();
      return Success;
    }

    QLoggingCategory::setFilterRules(parser.isSet(verboseOption) ? "" : "*.debug=false");

    if (parser.positionalArguments().size() > 1)
    {
      qCritical() << "[RDP]at most one input may be named";
      return Usage;
    }

    QScopedPointer<QSettings> settings {parser.isSet(configOption)
                                      ? new QSettings(parser.value(configOption), QSettings::IniFormat)
                                      : new QSettings()};

    Configuration configuration {settings.data()};

    auto epsilon   = configuration.epsilon();
    auto precision = configuration.precision();
    auto delimiter = configuration.delimiter();

    if (parser.isSet(epsilonOption))
    {
      bool ok;
      epsilon = parser.value(epsilonOption).toDouble(&ok);
      if (!ok)
      {
        qCritical() << "[RDP]invalid epsilon:" << parser.value(epsilonOption);
        return Usage;
      }
    }

    if (parser.isSet(precisionOption))
    {
      bool ok;
      precision = parser.value(precisionOption).toInt(&ok);
      if (!ok || precision < Configuration::MinPrecision
              || precision > Configuration::MaxPrecision)
      {
        qCritical() << "[RDP]invalid precision:" << parser.value(precisionOption);
        return Usage;
      }
    }

    if (parser.isSet(delimiterOption))
    {
      auto const value = parser.value(delimiterOption);
      if (value.size() != 1)
      {
        qCritical() << "[RDP]delimiter must be a single character:" << value;
        return Usage;
      }
      delimiter = value[0];
    }

    if (!RDP::simplifiable(epsilon))
    {
      qWarning() << "[RDP]epsilon" << epsilon << "is not a positive, finite value; polyline will be unchanged";
    }

    // Read, simplify, write.

    auto const inputName = parser.positionalArguments().value(0);

    QFile input;
    if (!openStream(input, inputName, stdin, QIODevice::ReadOnly | QIODevice::Text)) return IO;

    QTextStream inputStream {&input};
    QPolygonF   polygon;
    qsizetype   line = 0;

    if (auto const ec = PointFile::read(inputStream, polygon, &line))
    {
      qCritical() << "[RDP]line" << line << "of" << (inputName.isEmpty() ? STANDARD_STREAM : inputName) << ":" << ec.message().c_str();
      return IO;
    }

    QElapsedTimer timer;
    timer.start();

    auto const simplified = RDP::simplify(polygon, epsilon);

    qDebug() << "[RDP]simplified" << polygon.size() << "points to" << simplified.size()
             << "at epsilon" << epsilon << "in" << timer.nsecsElapsed() / 1000.0 << "us";

    QFile output;
    if (!openStream(output, parser.value(outputOption), stdout, QIODevice::WriteOnly | QIODevice::Text)) return IO;

    QTextStream outputStream {&output};

    if (auto const ec = PointFile::write(outputStream, simplified, delimiter, precision))
    {
      qCritical() << "[RDP]unable to write output:" << ec.message().c_str();
      return IO;
    }

    return Success;
  }
}

/******************************************************************************/
