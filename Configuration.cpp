#include "Configuration.hpp"
#include <algorithm>
#include <QSettings>
#include <QString>
#include <QVariant>

/******************************************************************************/
// Local Utilities
/******************************************************************************/

namespace
{
  // Group within which all of our settings live.

  constexpr auto GROUP = "Simplify";

  // RAII helper; enters a settings group on construction and leaves it
  // on destruction.

  class SettingsGroup
  {
    QSettings * settings_;

  public:

    SettingsGroup(QSettings     * settings,
                  QString const & group)
    : settings_ {settings}
    {
      settings_->beginGroup(group);
    }

    ~SettingsGroup()
    {
      settings_->endGroup();
    }

    SettingsGroup            (SettingsGroup const &) = delete;
    SettingsGroup & operator=(SettingsGroup const &) = delete;
  };

  auto
  clampPrecision(int const precision)
  {
    return std::clamp(precision,
                      Configuration::MinPrecision,
                      Configuration::MaxPrecision);
  }
}

/******************************************************************************/
// Private Implementation
/******************************************************************************/

class Configuration::impl final
{
public:

  explicit impl(QSettings * settings)
  : settings_ {settings}
  {
    read_settings();
  }

  void read_settings();
  void write_setting(QString const & key,
                     QVariant const & value);

  QSettings * settings_;

  qreal epsilon_;
  int   precision_;
  QChar delimiter_;
};

// This should be the only place where a hard coded value for a settings
// item is defined.

void
Configuration::impl::read_settings()
{
  SettingsGroup g {settings_, GROUP};

  epsilon_   = settings_->value("Epsilon", 1.0).toDouble();
  precision_ = clampPrecision(settings_->value("Precision", 10).toInt());

  // Delimiter is stored as a string; anything other than exactly one
  // character isn't something we can use, so fall back to a space.

  auto const delimiter = settings_->value("Delimiter", QString {" "}).toString();
  delimiter_ = delimiter.size() == 1 ? delimiter[0] : QLatin1Char(' ');
}

void
Configuration::impl::write_setting(QString  const & key,
                                   QVariant const & value)
{
  SettingsGroup g {settings_, GROUP};
  settings_->setValue(key, value);
}

/******************************************************************************/
// Public Implementation
/******************************************************************************/

Configuration::Configuration(QSettings * settings)
: m_ {std::make_unique<impl>(settings)}
{}

Configuration::~Configuration() = default;

qreal Configuration::epsilon()   const { return m_->epsilon_;   }
int   Configuration::precision() const { return m_->precision_; }
QChar Configuration::delimiter() const { return m_->delimiter_; }

void
Configuration::setEpsilon(qreal const epsilon)
{
  m_->epsilon_ = epsilon;
  m_->write_setting("Epsilon", epsilon);
}

void
Configuration::setPrecision(int const precision)
{
  m_->precision_ = clampPrecision(precision);
  m_->write_setting("Precision", m_->precision_);
}

void
Configuration::setDelimiter(QChar const delimiter)
{
  m_->delimiter_ = delimiter;
  m_->write_setting("Delimiter", QString(delimiter));
}

/******************************************************************************/
