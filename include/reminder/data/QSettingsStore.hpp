#pragma once

#include <QString>

#include "reminder/data/SettingsStore.hpp"

class QSettings;

namespace reminder {
namespace data {

class QSettingsStore : public SettingsStore
{
public:
    // Uses the application-scope QSettings.
    QSettingsStore();
    // Uses an INI file at the given path.
    explicit QSettingsStore(QString iniPath);
    ~QSettingsStore() override = default;

    Settings load() const override;
    bool save(const Settings &settings) override;

private:
    void read(const QSettings &settings, Settings &out) const;
    void write(QSettings &settings, const Settings &in) const;

    QString m_iniPath;
};

} // namespace data
} // namespace reminder
