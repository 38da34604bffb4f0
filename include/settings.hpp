#pragma once

#include <optional>
#include <string>
#include "activity_log.hpp"

namespace config {

struct Settings {
    std::string host;
    std::string code;
};

// [server] host / [session] code, persisted as an INI file
class ConfigStore {
public:
    explicit ConfigStore(std::string path, logging::StatusCallback logger = nullptr);

    const std::string& path() const { return path_; }

    // Missing file or unreadable content yields empty values
    Settings load_all() const;

    // Updates only the keys given; other content of the file is preserved
    bool save(const std::optional<std::string>& host, const std::optional<std::string>& code);

    bool save_host(const std::string& host) { return save(host, std::nullopt); }
    bool save_code(const std::string& code) { return save(std::nullopt, code); }

private:
    void log(const std::string& message) const;

    std::string path_;
    logging::StatusCallback logger_;
};

// $XDG_CONFIG_HOME/relaydrop/config.ini, then ~/.config/relaydrop/config.ini, then ./config.ini
std::string default_config_path();

} // namespace config
