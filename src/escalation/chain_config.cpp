// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "escalation/chain_config.hpp"

#include "util/logging.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace conduit {
namespace escalation {

namespace {

ChainConfigResult LinksFromJson(const json& j, std::vector<ChainLink>& out) {
  const json* links = &j;
  if (j.is_object()) {
    if (!j.contains("links")) {
      LOG_CHAIN_ERROR("Chain config: object form requires a \"links\" array");
      return ChainConfigResult::INVALID;
    }
    links = &j["links"];
  }

  if (!links->is_array() || links->empty()) {
    LOG_CHAIN_ERROR("Chain config: expected a non-empty array of links");
    return ChainConfigResult::INVALID;
  }

  std::vector<ChainLink> parsed;
  parsed.reserve(links->size());
  for (size_t i = 0; i < links->size(); ++i) {
    const json& entry = (*links)[i];
    if (!entry.is_object()) {
      LOG_CHAIN_ERROR("Chain config: link {} is not an object", i);
      return ChainConfigResult::INVALID;
    }

    if (!entry.contains("label") || !entry["label"].is_string() || entry["label"].get<std::string>().empty()) {
      LOG_CHAIN_ERROR("Chain config: link {} needs a non-empty string \"label\"", i);
      return ChainConfigResult::INVALID;
    }

    if (!entry.contains("capacity") || !entry["capacity"].is_number_integer()) {
      LOG_CHAIN_ERROR("Chain config: link {} needs an integer \"capacity\"", i);
      return ChainConfigResult::INVALID;
    }
    auto capacity = entry["capacity"].get<int64_t>();
    if (capacity < 0 || capacity > std::numeric_limits<int>::max()) {
      LOG_CHAIN_ERROR("Chain config: link {} capacity {} out of range", i, capacity);
      return ChainConfigResult::INVALID;
    }

    parsed.push_back(ChainLink{static_cast<int>(capacity), entry["label"].get<std::string>()});
  }

  out = std::move(parsed);
  return ChainConfigResult::SUCCESS;
}

}  // namespace

std::string ChainConfigResultAsString(ChainConfigResult result) {
  switch (result) {
  case ChainConfigResult::SUCCESS:
    return "success";
  case ChainConfigResult::FILE_NOT_FOUND:
    return "file not found";
  case ChainConfigResult::PARSE_ERROR:
    return "parse error";
  case ChainConfigResult::INVALID:
    return "invalid chain definition";
  default:
    return "unknown";
  }
}

ChainConfigResult ParseChainLinks(const std::string& json_text, std::vector<ChainLink>& out) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    LOG_CHAIN_ERROR("Chain config: failed to parse JSON: {}", e.what());
    return ChainConfigResult::PARSE_ERROR;
  }
  return LinksFromJson(j, out);
}

ChainConfigResult LoadChainLinks(const std::string& path, std::vector<ChainLink>& out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_CHAIN_ERROR("Chain config: cannot open {}", path);
    return ChainConfigResult::FILE_NOT_FOUND;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto result = ParseChainLinks(buffer.str(), out);
  if (result == ChainConfigResult::SUCCESS) {
    LOG_CHAIN_INFO("Chain config: loaded {} links from {}", out.size(), path);
  }
  return result;
}

}  // namespace escalation
}  // namespace conduit
