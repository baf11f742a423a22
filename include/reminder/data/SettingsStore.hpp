#pragma once

#include "reminder/data/Settings.hpp"

namespace reminder {
namespace data {

class SettingsStore
{
public:
    virtual ~SettingsStore() = default;

    // Missing values come back as defaults.
    virtual Settings load() const = 0;
    virtual bool save(const Settings &settings) = 0;
};

} // namespace data
} // namespace reminder
