/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: 2020 SUSE LLC */

/*
  Retrieves configuration values, set via configuration file or using
  default values otherwise.
 */

#ifndef U_K_CONFIGURATION_H
#define U_K_CONFIGURATION_H

#include <string>
#include <vector>

typedef struct econf_file econf_file;

namespace UpdateKit {

class Configuration {
public:
    /**
     * @brief Read upkit.conf from the vendor (PREFIX/CONFDIR) and admin (CONFDIR) locations
     */
    Configuration();
    /**
     * @brief Read upkit.conf (and upkit.conf.d/) from the given directories
     * @param vendorDir directory with the distribution defaults
     * @param adminDir directory with the administrator's settings, taking precedence
     */
    Configuration(const std::string &vendorDir, const std::string &adminDir);
    virtual ~Configuration();
    Configuration(const Configuration&) = delete;
    void operator=(const Configuration&) = delete;
    std::string get(const std::string &key);
    // Accepts true/false, yes/no and 1/0; throws std::runtime_error for anything else
    bool getBool(const std::string &key);
    std::vector<std::string> getArray(const std::string &key);
private:
    econf_file *key_file = nullptr;
};

} // namespace UpdateKit

#endif // U_K_CONFIGURATION_H
