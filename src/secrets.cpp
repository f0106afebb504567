#include "secrets.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Secrets::Secrets()
    : m_Schema{SECRETS_SCHEMA_NAME,
               SECRET_SCHEMA_NONE,
               {{"setting", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {nullptr, static_cast<SecretSchemaAttributeType>(0)}}} {}

// ─────────────────────────────────────
bool Secrets::Store(const std::string &setting, const std::string &value) {
    if (setting.empty() || value.empty()) {
        spdlog::error("Refusing to store an empty {}", setting.empty() ? "setting name" : setting);
        return false;
    }

    const std::string label = "workclock " + setting;
    GError *error = nullptr;
    gboolean stored =
        secret_password_store_sync(&m_Schema, SECRET_COLLECTION_DEFAULT, label.c_str(),
                                   value.c_str(), nullptr, &error, "setting", setting.c_str(),
                                   nullptr);
    if (error) {
        spdlog::error("Keyring rejected {}: {}", setting, error->message);
        g_clear_error(&error);
        return false;
    }
    return stored == TRUE;
}

// ─────────────────────────────────────
std::optional<std::string> Secrets::Lookup(const std::string &setting) {
    GError *error = nullptr;
    gchar *secret = secret_password_lookup_sync(&m_Schema, nullptr, &error, "setting",
                                                setting.c_str(), nullptr);
    if (error) {
        spdlog::warn("Keyring lookup for {} failed: {}", setting, error->message);
        g_clear_error(&error);
        return std::nullopt;
    }
    if (!secret) {
        spdlog::debug("Keyring has no {}", setting);
        return std::nullopt;
    }

    std::string value(secret);
    secret_password_free(secret);
    return value;
}
