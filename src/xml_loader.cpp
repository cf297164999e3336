#include "xml_loader.hpp"

namespace config
{

    HubConfig XmlConfigurationLoader::load(const std::string& path) const
    {
        ConfigManager mgr;
        auto          cfg = mgr.loadHubConfigFromXml(path, true);
        mgr.validateHubConfig(cfg);
        return cfg;
    }

    std::vector<SchemaIssue> XmlConfigurationLoader::validateOnly(const std::string& path) const
    {
        ConfigManager mgr;
        return mgr.validateXmlSchema(path);
    }

} // namespace config
