#ifndef __AGT_MODEL_SETTINGS_HPP__
#define __AGT_MODEL_SETTINGS_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace agt {
/**
 * @brief Reads the provider configuration out of the settings JSON file.
 *
 * The `openai` section supplies `model`, `api_key` and `base_url`. The file
 * is read again on every call so edits apply to the next connection.
 */
class ModelSettings {
 public:
  explicit ModelSettings(const string& _path) : path(_path) {}

  /**
   * @brief Current model configuration. Missing, unreadable or malformed
   * files and empty strings all give absent fields.
   */
  ModelConfig load() const;

  /** @brief Extracts the configuration from an already parsed document. */
  static ModelConfig fromJson(const json& settings);

  inline const string& getPath() const { return path; }

 protected:
  string path;
};
}  // namespace agt

#endif  // __AGT_MODEL_SETTINGS_HPP__
