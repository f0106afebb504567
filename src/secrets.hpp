#pragma once

#include <optional>
#include <string>

#include <libsecret/secret.h>

#define SECRETS_SCHEMA_NAME "io.workclock.ApiKey"

// API keys kept in the session keyring. Each item is tagged with the
// "setting" attribute, e.g. setting=clockify_key.
class Secrets {
  public:
    Secrets();

    bool Store(const std::string &setting, const std::string &value);

    // nullopt when the keyring has no item or cannot be reached
    std::optional<std::string> Lookup(const std::string &setting);

  private:
    SecretSchema m_Schema;
};
