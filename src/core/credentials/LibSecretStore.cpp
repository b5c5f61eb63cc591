/**
 * Valstore - LibSecret Credential Store (Linux)
 *
 * Primary credential source. Bundles are kept encrypted in the user's
 * keyring as a JSON secret.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "CredentialStore.hpp"

#include "core/Masking.hpp"

#include <libsecret/secret.h>
#include <glib.h>

#include <spdlog/spdlog.h>

namespace valstore {

namespace {

const SecretSchema* getCredentialSchema() {
    static const SecretSchema schema = {
        "com.valstore.credentials",
        SECRET_SCHEMA_NONE,
        {
            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"user_id", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING}
        }
    };
    return &schema;
}

} // anonymous namespace

class LibSecretStore : public CredentialStore {
public:
    LibSecretStore() {
        m_available = checkAvailability();
        if (m_available) {
            spdlog::info("LibSecret credential store initialized");
        } else {
            spdlog::warn("LibSecret not available");
        }
    }

    std::optional<CredentialBundle> load(const std::string& userId) const override {
        if (!m_available) {
            return std::nullopt;
        }

        GError* error = nullptr;

        gchar* secret = secret_password_lookup_sync(
            getCredentialSchema(),
            nullptr,  // Cancellable
            &error,
            "service", VALSTORE_CREDENTIAL_SERVICE,
            "user_id", userId.c_str(),
            nullptr
        );

        if (error) {
            spdlog::warn("Failed to read credentials: {}", error->message);
            g_error_free(error);
            return std::nullopt;
        }

        if (!secret) {
            spdlog::debug("No keyring credentials for user {}", userId);
            return std::nullopt;
        }

        std::string payload(secret);
        secret_password_free(secret);

        auto bundle = CredentialBundle::fromJson(payload);
        spdlog::debug("Loaded keyring credentials for user {} (ssid={})",
                      userId, maskSecret(bundle.ssid).toStdString());
        return bundle;
    }

    bool store(const std::string& userId, const CredentialBundle& bundle) override {
        if (!m_available) {
            return false;
        }

        GError* error = nullptr;
        std::string label = std::string(VALSTORE_CREDENTIAL_SERVICE) + " - " + userId;
        std::string payload = bundle.toJson();

        gboolean result = secret_password_store_sync(
            getCredentialSchema(),
            SECRET_COLLECTION_DEFAULT,
            label.c_str(),
            payload.c_str(),
            nullptr,  // Cancellable
            &error,
            "service", VALSTORE_CREDENTIAL_SERVICE,
            "user_id", userId.c_str(),
            nullptr
        );

        if (error) {
            spdlog::error("Failed to store credentials: {}", error->message);
            g_error_free(error);
            return false;
        }

        spdlog::debug("Stored keyring credentials for user {}", userId);
        return result == TRUE;
    }

    bool isAvailable() const override {
        return m_available;
    }

    std::string displayName() const override {
        return "keyring";
    }

private:
    bool checkAvailability() {
        GError* error = nullptr;
        SecretService* service = secret_service_get_sync(
            SECRET_SERVICE_LOAD_COLLECTIONS,
            nullptr,
            &error
        );

        if (error) {
            spdlog::debug("LibSecret not available: {}", error->message);
            g_error_free(error);
            return false;
        }

        if (service) {
            g_object_unref(service);
        }

        return true;
    }

    bool m_available = false;
};

std::unique_ptr<CredentialStore> createLibSecretStore() {
    return std::make_unique<LibSecretStore>();
}

} // namespace valstore

#endif // PLATFORM_LINUX
