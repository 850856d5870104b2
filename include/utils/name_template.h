#ifndef NAME_TEMPLATE_H
#define NAME_TEMPLATE_H

#include <map>
#include <string>

using TemplateVars = std::map<std::string, std::string>;

// Replaces {{NAME}} and {{.NAME}} placeholders with values from vars.
// Throws TemplateError for an unknown variable, an empty or malformed name,
// or an unterminated placeholder. Text outside placeholders is copied as is.
std::string resolveNameTemplate(const std::string &pattern,
                                const TemplateVars &vars);

bool hasTemplatePlaceholders(const std::string &pattern);

// PR_NUMBER, BRANCH and COMMIT_SHORT taken from GitHub Actions or GitLab CI
// environment variables, when present.
TemplateVars collectCiTemplateVars();

#endif
