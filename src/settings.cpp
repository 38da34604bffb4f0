#include "settings.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace config {

ConfigStore::ConfigStore(std::string path, logging::StatusCallback logger)
    : path_(std::move(path)), logger_(std::move(logger)) {}

void ConfigStore::log(const std::string& message) const {
    if (logger_) logger_(message);
}

Settings ConfigStore::load_all() const {
    Settings result;
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return result;
    }

    try {
        pt::ptree tree;
        pt::read_ini(path_, tree);
        result.host = boost::algorithm::trim_copy(tree.get<std::string>("server.host", ""));
        result.code = boost::algorithm::trim_copy(tree.get<std::string>("session.code", ""));
    } catch (const pt::ptree_error& e) {
        log(std::string("[配置] 读取配置文件时发生错误：") + e.what());
        return Settings{};
    }
    return result;
}

bool ConfigStore::save(const std::optional<std::string>& host, const std::optional<std::string>& code) {
    pt::ptree tree;
    std::error_code ec;
    if (fs::exists(path_, ec)) {
        try {
            pt::read_ini(path_, tree);
        } catch (const pt::ptree_error&) {
            // Unreadable file: rewrite it from scratch
            tree.clear();
        }
    }

    // write_ini turns a childless top-level node into a global key, so each
    // section always carries its key, empty when unset
    tree.put("server.host", host ? *host : tree.get<std::string>("server.host", ""));
    tree.put("session.code", code ? *code : tree.get<std::string>("session.code", ""));

    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        pt::write_ini(path_, tree);
    } catch (const std::exception& e) {
        log(std::string("[配置] 保存配置文件失败：") + e.what());
        return false;
    }

    if (host) {
        log("[配置] 已保存服务器地址到配置文件：" + path_);
    }
    if (code) {
        log(code->empty() ? "[配置] 已清空已保存的验证码" : "[配置] 已保存验证码到配置文件");
    }
    return true;
}

std::string default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (fs::path(xdg) / "relaydrop" / "config.ini").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".config" / "relaydrop" / "config.ini").string();
    }
    return "config.ini";
}

} // namespace config
