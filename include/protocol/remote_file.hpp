#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace protocol {

struct RemoteFileRecord {
    std::string id;
    std::string file_name;
};

// {"id": 17, "fileName": "a.txt"}; ids may arrive as numbers or strings,
// a missing or null fileName falls back to the id
void from_json(const nlohmann::json& j, RemoteFileRecord& record);

// Entries of body["data"] in server order; malformed entries are skipped
std::vector<RemoteFileRecord> parse_file_list(const nlohmann::json& body);

// Truthiness of body["success"]
bool is_success(const nlohmann::json& body);

// body["msg"] as text, empty when absent
std::string message_of(const nlohmann::json& body);

} // namespace protocol
