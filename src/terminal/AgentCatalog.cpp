#include "AgentCatalog.hpp"

#include "SubprocessUtils.hpp"

namespace agt {
namespace {
const char FALLBACK_BANNER_SCRIPT[] =
    "echo \"\"\n"
    "echo \"------------------------------------------------\"\n"
    "echo \"  Agent '$1' is not installed (command not found)\"\n"
    "echo \"------------------------------------------------\"\n"
    "echo \"\"\n"
    "echo \"  To install, run:\"\n"
    "echo \"    $2\"\n"
    "echo \"\"\n"
    "echo \"  Starting a shell instead...\"\n"
    "echo \"\"\n"
    "exec \"$3\"\n";

AgentProfile makeClaude() {
  AgentProfile p;
  p.kind = "claude";
  p.command = {"claude", "--dangerously-skip-permissions"};
  p.staticEnvironment = {{"CLAUDE_CODE_ENTRYPOINT", "1"}};
  p.installHint = "npm install -g @anthropic-ai/claude-code";
  p.kickoffPrompt =
      "Read the CLAUDE.md file in this directory for project context and "
      "instructions.\n"
      "Then autonomously start working on the task described there.\n"
      "Create progress checkpoints, generate code, and keep working until the "
      "task is complete.\n"
      "Do not ask for permission - execute all necessary operations "
      "autonomously.";
  p.modelVariable = "ANTHROPIC_MODEL";
  p.modelAliases = {
      {"sonnet", "claude-sonnet-4-20250514"},
      {"opus", "claude-opus-4-20250514"},
      {"haiku", "claude-haiku-3-20250514"},
  };
  return p;
}

AgentProfile makeGemini() {
  AgentProfile p;
  p.kind = "gemini";
  p.command = {"gemini"};
  p.staticEnvironment = {{"GEMINI_AUTO_APPROVE", "true"},
                         {"GEMINI_SANDBOX_RUN", "true"}};
  p.installHint = "npm install -g @google/gemini-cli";
  p.kickoffPrompt =
      "Read the GEMINI.md file for project context and task instructions.\n"
      "Start the workflow autonomously. Generate code, run it, and report "
      "progress.\n"
      "Execute all operations without asking for confirmation.";
  p.modelVariable = "GEMINI_MODEL";
  p.apiKeyVariable = "GOOGLE_API_KEY";
  p.apiKeyBaseUrlFilter = "google";
  return p;
}

AgentProfile makeAider() {
  AgentProfile p;
  p.kind = "aider";
  p.command = {"aider", "--yes", "--no-suggest-shell-commands"};
  p.staticEnvironment = {{"AIDER_AUTO_COMMITS", "true"},
                         {"AIDER_YES", "true"},
                         {"AIDER_AUTO_LINT", "true"}};
  p.installHint = "pip install aider-chat";
  p.kickoffPrompt =
      "Read the project context from README.md and any .md files.\n"
      "Start implementing the code autonomously.\n"
      "Commit changes as you go and keep working until complete.";
  p.modelVariable = "AIDER_MODEL";
  p.apiKeyVariable = "OPENAI_API_KEY";
  p.baseUrlVariable = "OPENAI_API_BASE";
  return p;
}

AgentProfile makeCodex() {
  AgentProfile p;
  p.kind = "codex";
  p.command = {"codex"};
  p.staticEnvironment = {{"CODEX_AUTO_APPROVE", "true"}};
  p.installHint = "npm install -g @openai/codex";
  p.modelVariable = "OPENAI_MODEL";
  p.apiKeyVariable = "OPENAI_API_KEY";
  p.baseUrlVariable = "OPENAI_API_BASE";
  return p;
}

AgentProfile makeQwen() {
  AgentProfile p;
  p.kind = "qwen";
  p.command = {"qwen"};
  p.staticEnvironment = {{"QWEN_AUTO_RUN", "true"}};
  p.installHint = "npm install -g @qwen-code/qwen-code";
  p.modelVariable = "QWEN_MODEL";
  p.apiKeyVariable = "DASHSCOPE_API_KEY";
  return p;
}

AgentProfile makePlain(const string& kind, const string& executable) {
  AgentProfile p;
  p.kind = kind;
  p.command = {executable};
  p.installHint = "Install " + executable + " with your system package manager";
  return p;
}
}  // namespace

AgentCatalog::AgentCatalog() {
  add(makeClaude());
  add(makeGemini());
  add(makeAider());
  add(makeCodex());
  add(makeQwen());
  add(makePlain("bash", "bash"));
  add(makePlain("python", "python3"));
}

optional<AgentProfile> AgentCatalog::find(const string& kind) const {
  auto it = profiles.find(kind);
  if (it == profiles.end()) {
    return nullopt;
  }
  return it->second;
}

void AgentCatalog::add(const AgentProfile& profile) {
  profiles[profile.kind] = profile;
}

vector<string> AgentCatalog::resolveCommand(const string& kind) const {
  auto profile = find(kind);
  if (!profile) {
    LOG(WARNING) << "Unknown agent kind " << kind << ", starting a shell";
    return fallbackShell(kind, "Install the " + kind + " CLI");
  }
  string executable = SubprocessUtils::findInPath(profile->command[0]);
  if (executable.empty()) {
    LOG(WARNING) << "Agent " << kind << " (" << profile->command[0]
                 << ") is not on PATH, starting a shell";
    return fallbackShell(kind, profile->installHint);
  }
  vector<string> argv = profile->command;
  argv[0] = executable;
  return argv;
}

vector<string> AgentCatalog::fallbackShell(const string& kind,
                                           const string& installHint) {
  string shell = SubprocessUtils::findInPath("bash");
  if (shell.empty()) {
    shell = "/bin/sh";
  }
  // The agent name and hint travel as positional parameters so they are never
  // parsed as shell code.
  return {shell, "-c", FALLBACK_BANNER_SCRIPT, "agentterm-fallback", kind,
          installHint, shell};
}

map<string, string> AgentCatalog::buildModelEnvironment(
    const string& kind, const ModelConfig& config) const {
  map<string, string> env;
  auto profile = find(kind);
  if (!profile) {
    return env;
  }

  if (!profile->modelVariable.empty() && config.has_default_model() &&
      !config.default_model().empty()) {
    string model = config.default_model();
    auto alias = profile->modelAliases.find(toLower(model));
    if (alias != profile->modelAliases.end()) {
      model = alias->second;
    }
    env[profile->modelVariable] = model;
  }

  if (!profile->apiKeyVariable.empty() && config.has_api_key() &&
      !config.api_key().empty()) {
    bool allowed = true;
    if (!profile->apiKeyBaseUrlFilter.empty()) {
      allowed = config.has_base_url() &&
                toLower(config.base_url()).find(profile->apiKeyBaseUrlFilter) !=
                    string::npos;
    }
    if (allowed) {
      env[profile->apiKeyVariable] = config.api_key();
    }
  }

  if (!profile->baseUrlVariable.empty() && config.has_base_url() &&
      !config.base_url().empty()) {
    env[profile->baseUrlVariable] = config.base_url();
  }
  return env;
}

string AgentCatalog::kickoffPrompt(const string& kind) const {
  auto profile = find(kind);
  return profile ? profile->kickoffPrompt : "";
}
}  // namespace agt
