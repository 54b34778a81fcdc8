#include "ModelSettings.hpp"

namespace agt {
namespace {
string stringField(const json& section, const char* name) {
  auto it = section.find(name);
  if (it == section.end() || !it->is_string()) {
    return "";
  }
  return it->get<string>();
}
}  // namespace

ModelConfig ModelSettings::load() const {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    VLOG(1) << "No settings file at " << path;
    return ModelConfig();
  }
  std::ifstream in(path);
  if (!in) {
    LOG(WARNING) << "Failed to read settings file " << path << ": "
                 << strerror(errno);
    return ModelConfig();
  }
  std::stringstream contents;
  contents << in.rdbuf();
  json settings = json::parse(contents.str(), nullptr, false);
  if (settings.is_discarded()) {
    LOG(WARNING) << "Failed to parse settings file " << path;
    return ModelConfig();
  }
  return fromJson(settings);
}

ModelConfig ModelSettings::fromJson(const json& settings) {
  ModelConfig config;
  if (!settings.is_object()) {
    return config;
  }
  auto openai = settings.find("openai");
  if (openai == settings.end() || !openai->is_object()) {
    return config;
  }
  string model = stringField(*openai, "model");
  if (!model.empty()) {
    config.set_default_model(model);
  }
  string apiKey = stringField(*openai, "api_key");
  if (!apiKey.empty()) {
    config.set_api_key(apiKey);
  }
  string baseUrl = stringField(*openai, "base_url");
  if (!baseUrl.empty()) {
    config.set_base_url(baseUrl);
  }
  return config;
}
}  // namespace agt
