#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace usd::ctl {

// Human-readable renderings of response payloads for userserversctl.
std::string renderList(const nlohmann::json& data);
std::string renderStatus(const nlohmann::json& data);
std::string renderRuntimeLine(const std::string& name, const nlohmann::json& runtime);

}
