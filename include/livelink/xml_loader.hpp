#pragma once

#include <string>
#include <vector>

#include "config_manager.hpp"

namespace config
{
    /**
     * Loads a hub configuration file: schema check with line numbers first, then parsing and
     * semantic validation through ConfigManager. Any problem surfaces as ConfigError or
     * std::runtime_error, which main treats as fatal.
     */
    class XmlConfigurationLoader
    {
      public:
        HubConfig load(const std::string& path) const;

        std::vector<SchemaIssue> validateOnly(const std::string& path) const;
    };

} // namespace config
