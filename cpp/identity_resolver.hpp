#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "placer_config.pb.h"
#include "placer_types.hpp"
#include "roster.hpp"

namespace retreat_placer {

enum class ResolutionStage {
    kCohortReference,  // classified as a group/org reference, never resolved
    kExactMatch,
    kNickname,
    kLastName,
    kFirstName,
    kLastNamePrefix,
    kFuzzy,
    kUnresolved,
};

const char* ResolutionStageName(ResolutionStage stage);

// One entry per nonempty attach reference, in roster order.
struct AttachAuditEntry {
    int person = 0;
    std::string attach_text;
    ResolutionStage stage = ResolutionStage::kUnresolved;
    int target = kUnassigned;
    double raw_similarity = 0.0;
    int affinity = 0;
    int candidate_count = 0;
    bool caveat = false;
    std::string message;
    std::vector<std::string> notes;  // intermediate rejections
};

struct IdentityResolution {
    // targets[p] = resolved person index or kUnassigned.
    std::vector<int> targets;
    std::vector<AttachAuditEntry> audit;

    bool IsMutual(int a) const {
        const int b = targets[a];
        return b != kUnassigned && targets[b] == a;
    }
    int ResolvedCount() const;
};

// +2 for a shared nonempty group, +1 for a shared nonempty org.
int AffinityScore(const Person& source, const Person& candidate);

// Affinity tie-break: the unique best-affinity candidate, else the first of the
// best tier when its affinity is positive, else kUnassigned (ambiguous).
int PickByAffinity(const std::vector<Person>& people, int source,
                   const std::vector<int>& candidates);

class IdentityResolver {
public:
    IdentityResolver(const std::vector<Person>& people, const CanonicalLabels& labels,
                     const IdentityOptions& options);

    IdentityResolution Resolve() const;

    bool IsCohortReference(const std::string& attach_text) const;

private:
    AttachAuditEntry ResolveOne(int person) const;

    bool TryExact(int person, const std::string& key, ResolutionStage stage,
                  AttachAuditEntry* entry) const;
    bool TryLastName(int person, const std::vector<std::string>& tokens,
                     std::unordered_set<int>* rejected, AttachAuditEntry* entry) const;
    bool TryFirstName(int person, const std::string& first, AttachAuditEntry* entry) const;
    bool TryPrefix(int person, const std::vector<std::string>& tokens,
                   AttachAuditEntry* entry) const;
    void FuzzyOrUnresolved(int person, const std::string& key,
                           const std::unordered_set<int>& rejected,
                           AttachAuditEntry* entry) const;

    void Accept(int person, int target, ResolutionStage stage, AttachAuditEntry* entry) const;
    std::string Nickname(const std::string& first) const;

    const std::vector<Person>& people;
    const IdentityOptions& options;

    // Lowercase "first last", and its first and last tokens, per person.
    // Empty for people missing either name; they are never candidates.
    std::vector<std::string> name_keys;
    std::vector<std::string> first_tokens;
    std::vector<std::string> last_tokens;

    std::unordered_set<std::string> non_person_compact;
    std::vector<std::string> non_person_prefixes;
    std::vector<std::string> non_person_separators;
};

// Lowercased, whitespace-collapsed reference text.
std::string NormalizeReference(const std::string& text);

}  // namespace retreat_placer
