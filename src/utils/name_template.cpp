#include "utils/name_template.h"
#include "core/fork_errors.h"
#include "utils/string_utils.h"
#include <cctype>
#include <cstdlib>
#include <initializer_list>

namespace {
bool isValidVariableName(const std::string &name) {
  if (name.empty())
    return false;
  for (size_t i = 0; i < name.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(name[i]);
    bool ok = std::isalpha(c) || c == '_' || (i > 0 && std::isdigit(c));
    if (!ok)
      return false;
  }
  return true;
}

std::string firstEnv(std::initializer_list<const char *> names) {
  for (const char *name : names) {
    const char *value = std::getenv(name);
    if (value && *value)
      return value;
  }
  return "";
}
} // namespace

std::string resolveNameTemplate(const std::string &pattern,
                                const TemplateVars &vars) {
  std::string resolved;
  size_t pos = 0;

  while (pos < pattern.size()) {
    size_t open = pattern.find("{{", pos);
    if (open == std::string::npos) {
      resolved += pattern.substr(pos);
      break;
    }
    resolved += pattern.substr(pos, open - pos);

    size_t close = pattern.find("}}", open + 2);
    if (close == std::string::npos) {
      throw TemplateError("unterminated placeholder in name template '" +
                          pattern + "'");
    }

    std::string name =
        StringUtils::trim(pattern.substr(open + 2, close - open - 2));
    if (!name.empty() && name[0] == '.')
      name = name.substr(1);

    if (!isValidVariableName(name)) {
      throw TemplateError("invalid placeholder '{{" +
                          pattern.substr(open + 2, close - open - 2) +
                          "}}' in name template '" + pattern + "'");
    }

    auto it = vars.find(name);
    if (it == vars.end()) {
      throw TemplateError("undefined template variable '" + name +
                          "' in name template '" + pattern + "'");
    }
    resolved += it->second;
    pos = close + 2;
  }

  return resolved;
}

bool hasTemplatePlaceholders(const std::string &pattern) {
  return pattern.find("{{") != std::string::npos;
}

TemplateVars collectCiTemplateVars() {
  TemplateVars vars;

  std::string prNumber = firstEnv({"GITHUB_PR_NUMBER", "CI_MERGE_REQUEST_IID"});
  if (!prNumber.empty())
    vars["PR_NUMBER"] = prNumber;

  std::string branch =
      firstEnv({"GITHUB_HEAD_REF", "GITHUB_REF_NAME", "CI_COMMIT_REF_NAME"});
  if (!branch.empty())
    vars["BRANCH"] = StringUtils::sanitizeIdentifier(branch);

  std::string sha = firstEnv({"GITHUB_SHA", "CI_COMMIT_SHA"});
  if (!sha.empty())
    vars["COMMIT_SHORT"] = sha.substr(0, 8);

  return vars;
}
