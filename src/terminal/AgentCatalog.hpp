#ifndef __AGT_AGENT_CATALOG_HPP__
#define __AGT_AGENT_CATALOG_HPP__

#include "Headers.hpp"

namespace agt {
/**
 * @brief Everything the server knows about one kind of command-line agent.
 */
struct AgentProfile {
  string kind;
  /** @brief argv; argv[0] is looked up on $PATH. */
  vector<string> command;
  /** @brief Variables that put the agent in unattended mode. */
  map<string, string> staticEnvironment;
  /** @brief Shown when the executable is missing. */
  string installHint;
  /** @brief Instruction typed into the agent after startup, may be empty. */
  string kickoffPrompt;
  /** @brief Variable receiving the model name, empty if none. */
  string modelVariable;
  /** @brief Variable receiving the API key, empty if none. */
  string apiKeyVariable;
  /** @brief The API key is only exported when the base URL contains this. */
  string apiKeyBaseUrlFilter;
  /** @brief Variable receiving the provider base URL, empty if none. */
  string baseUrlVariable;
  /** @brief Short model names mapped to full model identifiers. */
  map<string, string> modelAliases;
};

/**
 * @brief Lookup table of supported agents and the shell fallback.
 */
class AgentCatalog {
 public:
  /** @brief Builds the catalog with the built-in agent table. */
  AgentCatalog();

  /** @brief Profile for `kind`, or nullopt for an unknown agent. */
  optional<AgentProfile> find(const string& kind) const;

  /** @brief Registers or replaces a profile. */
  void add(const AgentProfile& profile);

  /**
   * @brief Resolves the argv to run for `kind`.
   *
   * When the agent is unknown or its executable is not on $PATH, returns a
   * shell that prints an install banner and then stays interactive.
   */
  vector<string> resolveCommand(const string& kind) const;

  /**
   * @brief Provider variables derived from the model settings.
   *
   * Unset or empty settings produce no variable at all.
   */
  map<string, string> buildModelEnvironment(const string& kind,
                                            const ModelConfig& config) const;

  /** @brief Kickoff prompt for `kind`, empty when it has none. */
  string kickoffPrompt(const string& kind) const;

  /** @brief Shell used by the fallback banner. */
  static vector<string> fallbackShell(const string& kind,
                                      const string& installHint);

 protected:
  map<string, AgentProfile> profiles;
};
}  // namespace agt

#endif  // __AGT_AGENT_CATALOG_HPP__
