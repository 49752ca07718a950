// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_SETTINGS_H
#define SETTINGS_SETTINGS_H

#ifndef STRETCH_ENGINE_VERSION
#define STRETCH_ENGINE_VERSION "DEV"
#endif

#include <string>
#include <unordered_map>

namespace stretch
{

/*!
 * \brief Container for a set of settings.
 *
 * You can ask this container for the value of a certain setting that should be
 * used in the context where this settings container is located.
 *
 * Before the settings can be returned, the settings have to be added first
 * using the add() function.
 */
class Settings
{
public:
    /*
     * \brief Properly initialises the Settings instance.
     */
    Settings();

    /*!
     * \brief Adds a new setting.
     * \param key The name by which the setting is identified.
     * \param value The value of the setting. The value is always added and
     * stored in serialised form as a string.
     */
    void add(const std::string& key, const std::string& value);

    /*!
     * \brief Get the value of a setting.
     *
     * This value is then evaluated using the following technique:
     *  1. If this container contains a value for the setting, it uses that
     *     value directly.
     *  2. Otherwise it asks its parent settings container for the setting value
     *     and returns that. The parent then goes through the same process.
     *  3. If a setting is not known at all, a SettingNotFoundException is
     *     thrown.
     * \param key The key of the setting to get.
     * \return The setting's value, cast to the desired type.
     */
    template<typename A>
    A get(const std::string& key) const;

    /*!
     * \brief Get a string containing all settings in this container.
     *
     * The string is formatted in the same way as the command line arguments
     * when running StretchEngine from the command line.
     * \return A string containing all settings and their values.
     */
    std::string getAllSettingsString() const;

    /*!
     * \brief Indicate whether this settings instance, or one of its parents,
     * has an entry for the specified setting.
     * \param key The setting to check.
     */
    bool has(const std::string& key) const;

    /*
     * Change the parent settings object.
     *
     * If this set of settings has no value for a setting, the parent is asked.
     */
    void setParent(Settings* new_parent);

private:
    /*!
     * Optionally, a parent setting container to ask for the value of a setting
     * if this container has no value for it.
     */
    Settings* parent_;

    /*!
     * \brief A dictionary to map the setting keys to the actual setting values.
     */
    std::unordered_map<std::string, std::string> settings_;
};

} // namespace stretch

#endif // SETTINGS_SETTINGS_H
