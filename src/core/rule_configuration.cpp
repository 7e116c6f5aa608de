#include "rule_configuration.hpp"
#include "utils.hpp"

bool RuleConfiguration::is_excluded(const RemotePath& path) const {
    for (const auto& prefix : excludes) {
        if (!prefix.empty() && istarts_with(path.path(), prefix)) {
            return true;
        }
    }
    return false;
}

bool RuleConfiguration::is_app_data(const RemotePath& path) const {
    return app_data_skip_enabled && path.is_app_data(app_data_directory);
}
