#ifndef PIIMASK_MASKING_MASK_SESSION_HPP
#define PIIMASK_MASKING_MASK_SESSION_HPP

#include "config/mask_config.hpp"
#include "codec/json_codec.hpp"
#include "document/document.hpp"
#include "util/logger.hpp"
#include "vault/sqlite_token_store.hpp"
#include "vault/token_store.hpp"
#include "vault/token_vault.hpp"
#include "document_masker.hpp"
#include "key_classifier.hpp"
#include "text_unmasker.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace piimask {
namespace masking {

// -----------------------------------------------------------------------------
// MaskSession wires one vault, one classifier, a masker and an unmasker from a
// MaskConfig. The vault lives as long as the session; with the sqlite backend it
// also outlives the process.
// -----------------------------------------------------------------------------
class MaskSession {
  public:
    explicit MaskSession(const piimask::config::MaskConfig& config)
        : m_config(config),
          m_vault(openStore(config), parseLookupMode(config.lookupMode)) {
        m_classifier.addKnownKeys(m_config.knownKeys);
        m_classifier.addMaskedKeys(m_config.maskedKeys);

        MaskerOptions options;
        options.maxRecursionDepth = static_cast<std::size_t>(m_config.maxRecursionDepth);
        options.debug = m_config.debug;
        m_masker = std::make_unique<DocumentMasker>(m_classifier, m_vault, options);
        m_unmasker = std::make_unique<TextUnmasker>(m_vault, m_config.debug);

        piimask::util::logger::debug("[MaskSession] ready, backend=" + m_config.vaultBackend +
                                     ", lookup=" + m_config.lookupMode);
    }

    MaskSession(const MaskSession&) = delete;
    MaskSession& operator=(const MaskSession&) = delete;

    // Mask a parsed document
    document::Document maskDocument(const document::Document& doc) { return m_masker->mask(doc); }

    // Parse JSON text, mask it, render the result pretty-printed
    std::string maskJson(const std::string& jsonText) {
        return piimask::codec::renderJson(maskDocument(piimask::codec::parseJson(jsonText)));
    }

    std::string unmaskText(const std::string& text) const { return m_unmasker->unmask(text); }

    const MaskingReport& report() const { return m_masker->report(); }

    piimask::vault::TokenVault& vault() { return m_vault; }
    KeyClassifier& classifier() { return m_classifier; }
    const piimask::config::MaskConfig& config() const { return m_config; }

    // Summary line for operators; lists the unclassified keys that should be reviewed
    std::string describeReport() const {
        const MaskingReport& r = report();
        std::string text = "masked=" + std::to_string(r.maskedValues) +
                           " reused=" + std::to_string(r.reusedLabels) +
                           " unsupported=" + std::to_string(r.unsupportedNodes) +
                           " vault_size=" + std::to_string(m_vault.size());
        if (!r.unclassifiedKeys.empty()) {
            text += " unclassified_keys=";
            bool first = true;
            for (const auto& key : r.unclassifiedKeys) {
                text += (first ? "" : ",") + key;
                first = false;
            }
        }
        return text;
    }

  private:
    static std::shared_ptr<piimask::vault::TokenStore>
    openStore(const piimask::config::MaskConfig& config) {
        if (config.vaultBackend == "memory") {
            return std::make_shared<piimask::vault::InMemoryTokenStore>();
        }
        if (config.vaultBackend == "sqlite") {
            return std::make_shared<piimask::vault::SqliteTokenStore>(config.vaultPath);
        }
        throw std::runtime_error("[MaskSession] unknown vault backend: " + config.vaultBackend);
    }

    static piimask::vault::LookupMode parseLookupMode(const std::string& mode) {
        if (mode == "index") {
            return piimask::vault::LookupMode::INDEX;
        }
        if (mode == "scan") {
            return piimask::vault::LookupMode::LINEAR_SCAN;
        }
        throw std::runtime_error("[MaskSession] unknown lookup mode: " + mode);
    }

    piimask::config::MaskConfig m_config;
    KeyClassifier m_classifier;
    piimask::vault::TokenVault m_vault;
    std::unique_ptr<DocumentMasker> m_masker;
    std::unique_ptr<TextUnmasker> m_unmasker;
};

} // namespace masking
} // namespace piimask

#endif // PIIMASK_MASKING_MASK_SESSION_HPP
