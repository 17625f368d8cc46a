/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: 2020-2021 SUSE LLC */

/*
  Retrieves configuration values, set via configuration file or using
  default values otherwise.
 */

#include "Configuration.hpp"
#include "Util.hpp"
#include <map>
#include <regex>
#include <stdexcept>
#include <libeconf.h>

namespace UpdateKit {

namespace {

const std::map<std::string, std::string> defaults = {
    {"PACKAGE_MANAGER", "winget"},
    {"INVENTORY", "table"},
    {"SILENT", "false"},
    {"LOG_OUTPUT", "console"},
    {"UNKNOWN_VERSION_MARKERS[0]", "<"},
    {"UNKNOWN_VERSION_MARKERS[1]", "Unknown"}
};

} // anonymous namespace

Configuration::Configuration() : Configuration(std::string(PREFIX) + CONFDIR, CONFDIR) {
}

Configuration::Configuration(const std::string &vendorDir, const std::string &adminDir) {
    econf_file *kf_defaults;
    econf_err error = econf_newIniFile(&kf_defaults);
    if (error)
        throw std::runtime_error{"Could not create default configuration."};
    for(auto &[key, value] : defaults) {
        error = econf_setStringValue(kf_defaults, "", key.c_str(), value.c_str());
        if (error) {
            econf_freeFile(kf_defaults);
            throw std::runtime_error{"Could not set default value for '" + key + "'."};
        }
    }

    econf_file *kf_conffiles = nullptr;
    error = econf_readDirs(&kf_conffiles, vendorDir.c_str(), adminDir.c_str(), "upkit", ".conf", "=", "#");
    if (error && error != ECONF_NOFILE) {
        econf_freeFile(kf_defaults);
        econf_freeFile(kf_conffiles);
        throw std::runtime_error{"Couldn't read configuration file: " + std::string(econf_errString(error))};
    }

    if (error == ECONF_SUCCESS) {
        error = econf_mergeFiles(&key_file, kf_defaults, kf_conffiles);
        econf_freeFile(kf_defaults);
        econf_freeFile(kf_conffiles);
        if (error) {
            throw std::runtime_error{"Couldn't merge configuration: " + std::string(econf_errString(error))};
        }
    } else {
        econf_freeFile(kf_conffiles);
        key_file = kf_defaults;
    }
}

Configuration::~Configuration() {
    econf_freeFile(key_file);
}

std::string Configuration::get(const std::string &key) {
    CString val;
    econf_err error = econf_getStringValue(key_file, "", key.c_str(), &val.ptr);
    if (error)
        throw std::runtime_error{"Could not read configuration setting '" + key + "'."};
    if (val == nullptr)
        return "";
    return std::string(val);
}

bool Configuration::getBool(const std::string &key) {
    std::string value = Util::toLower(get(key));
    Util::trim(value);
    if (value == "true" || value == "yes" || value == "1")
        return true;
    if (value == "false" || value == "no" || value == "0" || value.empty())
        return false;
    throw std::runtime_error{"Invalid boolean value '" + value + "' for configuration setting '" + key + "'."};
}

std::vector<std::string> Configuration::getArray(const std::string &key) {
    std::vector<std::string> ret;
    econf_err error;

    size_t len = 0;
    char** confkeys;
    error = econf_getKeys(key_file, "", &len, &confkeys);
    if (error)
        throw std::runtime_error{"Could not read keys."};

    std::regex exp(key + "\\[.*\\]");
    for (size_t i = 0; i < len; i++) {
        if (std::regex_match(confkeys[i], exp)) {
            CString val;
            error = econf_getStringValue(key_file, "", confkeys[i], &val.ptr);
            if (error) {
                econf_freeArray(confkeys);
                throw std::runtime_error{"Could not read key '" + std::string(confkeys[i]) + "'."};
            }
            if (val != nullptr)
                ret.push_back(std::string(val));
        }
    }
    econf_freeArray(confkeys);

    return ret;
}

} // namespace UpdateKit
