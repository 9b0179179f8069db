#ifndef PIIMASK_MASKING_KEY_CLASSIFIER_HPP
#define PIIMASK_MASKING_KEY_CLASSIFIER_HPP

#include <string>
#include <vector>
#include <unordered_set>
#include <utility>

/**
 * @file key_classifier.hpp
 * @brief Decides, per field name, whether a value is safe to pass through, must always
 *        be masked, or has unknown sensitivity.
 *
 * DESIGN GOALS:
 *   - Exact, case-sensitive match of a key against two sets (known, masked).
 *   - Both sets are seeded with the entity-resolution export vocabulary and can be
 *     extended per deployment (see MaskConfig::knownKeys / maskedKeys).
 *   - A key in neither set is UNKNOWN, which the masker treats as "mask and warn"
 *     for text values. A key present in both sets is MASKED.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piimask::masking::KeyClassifier classifier;
 *   classifier.addMaskedKey("SSN_NUMBER");
 *   auto cls = classifier.classify("EMAIL");   // KeyClass::MASKED
 *   @endcode
 */

namespace piimask {
namespace masking {

/**
 * @enum KeyClass
 * @brief Sensitivity tier of a field key.
 */
enum class KeyClass {
    KNOWN = 0,   ///< structural or categorical metadata, never masked
    MASKED = 1,  ///< always replaced by a token
    UNKNOWN = 2  ///< matches neither set
};

inline const char *keyClassName(KeyClass cls)
{
    switch (cls) {
        case KeyClass::KNOWN:   return "KNOWN";
        case KeyClass::MASKED:  return "MASKED";
        case KeyClass::UNKNOWN: return "UNKNOWN";
    }
    return "?";
}

class KeyClassifier
{
public:
    /**
     * @brief Construct with the default known/masked vocabulary.
     */
    KeyClassifier()
        : knownKeys_(defaultKnownKeys()),
          maskedKeys_(defaultMaskedKeys())
    {
    }

    /**
     * @brief Construct with explicit sets, replacing the defaults entirely.
     */
    KeyClassifier(std::unordered_set<std::string> knownKeys,
                  std::unordered_set<std::string> maskedKeys)
        : knownKeys_(std::move(knownKeys)),
          maskedKeys_(std::move(maskedKeys))
    {
    }

    inline KeyClass classify(const std::string &key) const
    {
        if (maskedKeys_.count(key) > 0) {
            return KeyClass::MASKED;
        }
        if (knownKeys_.count(key) > 0) {
            return KeyClass::KNOWN;
        }
        return KeyClass::UNKNOWN;
    }

    inline void addKnownKey(const std::string &key) { knownKeys_.insert(key); }
    inline void addMaskedKey(const std::string &key) { maskedKeys_.insert(key); }

    inline void addKnownKeys(const std::vector<std::string> &keys)
    {
        knownKeys_.insert(keys.begin(), keys.end());
    }

    inline void addMaskedKeys(const std::vector<std::string> &keys)
    {
        maskedKeys_.insert(keys.begin(), keys.end());
    }

    const std::unordered_set<std::string> &knownKeys() const { return knownKeys_; }
    const std::unordered_set<std::string> &maskedKeys() const { return maskedKeys_; }

    static std::unordered_set<std::string> defaultKnownKeys()
    {
        return {
            "AMOUNT",
            "CANDIDATE_CAP_REACHED",
            "CANDIDATE_FEAT_USAGE_TYPE",
            "CATEGORY",
            "DATE",
            "ENTITY_ID",
            "ENTITY_TYPE",
            "ERRULE_CODE",
            "FIRST_SEEN_DT",
            "FTYPE_CODE",
            "INBOUND_FEAT_USAGE_TYPE",
            "INBOUND_VIRTUAL_ENTITY_ID",
            "IS_AMBIGUOUS",
            "IS_DISCLOSED",
            "LAST_SEEN_DT",
            "MATCH_KEY",
            "MATCH_LEVEL",
            "MATCH_LEVEL_CODE",
            "RECORD_TYPE",
            "RESULT_VIRTUAL_ENTITY_ID",
            "SCORE_BEHAVIOR",
            "SCORE_BUCKET",
            "SCORING_CAP_REACHED",
            "SOURCE",
            "STATUS",
            "SUPPRESSED",
            "TOKEN",
            "USAGE_TYPE",
            "USED_FOR_CAND",
            "USED_FOR_SCORING",
            "VIRTUAL_ENTITY_ID",
            "WHY_ERRULE_CODE",
            "WHY_KEY",
        };
    }

    static std::unordered_set<std::string> defaultMaskedKeys()
    {
        return {
            "ACCT_NUM",
            "CANDIDATE_FEAT_DESC",
            "DATA_SOURCE",
            "DOB",
            "DRLIC",
            "EMAIL",
            "ENTITY_DESC",
            "ENTITY_KEY",
            "ENTITY_NAME",
            "FEAT_DESC",
            "HOME",
            "INBOUND_FEAT_DESC",
            "ISSUING_BANK",
            "MAILING",
            "MOBILE",
            "PRIMARY",
            "RECORD_ID",
        };
    }

private:
    std::unordered_set<std::string> knownKeys_;
    std::unordered_set<std::string> maskedKeys_;
};

} // namespace masking
} // namespace piimask

#endif // PIIMASK_MASKING_KEY_CLASSIFIER_HPP
