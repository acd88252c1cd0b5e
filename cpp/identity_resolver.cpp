#include "identity_resolver.hpp"

#include <algorithm>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "ortools/base/logging.h"
#include "string_similarity.hpp"

using namespace std;

namespace retreat_placer {

namespace {

vector<string> Tokens(const string& normalized) {
    vector<string> tokens = absl::StrSplit(normalized, ' ', absl::SkipEmpty());
    return tokens;
}

}  // namespace

const char* ResolutionStageName(ResolutionStage stage) {
    switch (stage) {
        case ResolutionStage::kCohortReference: return "cohort-reference";
        case ResolutionStage::kExactMatch: return "exact";
        case ResolutionStage::kNickname: return "nickname";
        case ResolutionStage::kLastName: return "last-name";
        case ResolutionStage::kFirstName: return "first-name";
        case ResolutionStage::kLastNamePrefix: return "last-name-prefix";
        case ResolutionStage::kFuzzy: return "fuzzy";
        case ResolutionStage::kUnresolved: return "unresolved";
    }
    return "unknown";
}

string NormalizeReference(const string& text) {
    vector<string> words = absl::StrSplit(text, absl::ByAnyChar(" \t\r\n"), absl::SkipEmpty());
    return absl::AsciiStrToLower(absl::StrJoin(words, " "));
}

int IdentityResolution::ResolvedCount() const {
    return static_cast<int>(count_if(targets.begin(), targets.end(),
                                     [](int t) { return t != kUnassigned; }));
}

int AffinityScore(const Person& source, const Person& candidate) {
    int score = 0;
    if (!source.group.empty() && source.group == candidate.group) score += 2;
    if (!source.org.empty() && source.org == candidate.org) score += 1;
    return score;
}

int PickByAffinity(const vector<Person>& people, int source, const vector<int>& candidates) {
    if (candidates.empty()) return kUnassigned;

    int best_affinity = -1;
    int best = kUnassigned;
    int tier_size = 0;
    for (int c : candidates) {
        int affinity = AffinityScore(people[source], people[c]);
        if (affinity > best_affinity) {
            best_affinity = affinity;
            best = c;
            tier_size = 1;
        } else if (affinity == best_affinity) {
            ++tier_size;
        }
    }
    if (tier_size == 1 || best_affinity > 0) return best;
    return kUnassigned;
}

IdentityResolver::IdentityResolver(const vector<Person>& people, const CanonicalLabels& labels,
                                   const IdentityOptions& options)
    : people(people), options(options) {
    name_keys.reserve(people.size());
    first_tokens.reserve(people.size());
    last_tokens.reserve(people.size());
    for (const Person& p : people) {
        if (p.first_name.empty() || p.last_name.empty()) {
            name_keys.emplace_back();
            first_tokens.emplace_back();
            last_tokens.emplace_back();
            continue;
        }
        name_keys.push_back(NormalizeReference(p.FullName()));
        vector<string> first = Tokens(NormalizeReference(p.first_name));
        vector<string> last = Tokens(NormalizeReference(p.last_name));
        first_tokens.push_back(first.empty() ? "" : first.front());
        last_tokens.push_back(last.empty() ? "" : last.back());
    }

    for (const string& phrase : options.non_person_exact()) {
        non_person_compact.insert(CompactKey(phrase));
    }
    for (const string& org : labels.orgs.Labels()) non_person_compact.insert(CompactKey(org));
    for (const string& group : labels.groups.Labels()) non_person_compact.insert(CompactKey(group));

    for (const string& prefix : options.non_person_prefix()) {
        non_person_prefixes.push_back(absl::AsciiStrToLower(prefix));
    }
    for (const string& sep : options.non_person_separator()) {
        non_person_separators.push_back(absl::AsciiStrToLower(sep));
    }
}

IdentityResolution IdentityResolver::Resolve() const {
    IdentityResolution resolution;
    resolution.targets.assign(people.size(), kUnassigned);

    for (int i = 0; i < static_cast<int>(people.size()); ++i) {
        if (people[i].attach_text.empty()) continue;
        AttachAuditEntry entry = ResolveOne(i);
        resolution.targets[i] = entry.target;

        for (const string& note : entry.notes) {
            LOG(WARNING) << people[i].FullName() << ": " << note;
        }
        if (entry.caveat) {
            LOG(WARNING) << people[i].FullName() << ": " << entry.message;
        } else {
            LOG(INFO) << people[i].FullName() << ": " << entry.message;
        }
        resolution.audit.push_back(std::move(entry));
    }

    LOG(INFO) << "Attach references: " << resolution.audit.size() << " processed, "
              << resolution.ResolvedCount() << " resolved";
    return resolution;
}

bool IdentityResolver::IsCohortReference(const string& attach_text) const {
    const string lower = NormalizeReference(attach_text);
    if (lower.empty()) return false;
    if (non_person_compact.count(CompactKey(attach_text)) > 0) return true;
    for (const string& prefix : non_person_prefixes) {
        if (!prefix.empty() && absl::StartsWith(lower, prefix)) return true;
    }
    for (const string& sep : non_person_separators) {
        if (!sep.empty() && absl::StrContains(lower, sep)) return true;
    }
    return false;
}

string IdentityResolver::Nickname(const string& first) const {
    auto it = options.nicknames().find(first);
    return it == options.nicknames().end() ? first : it->second;
}

void IdentityResolver::Accept(int person, int target, ResolutionStage stage,
                              AttachAuditEntry* entry) const {
    entry->target = target;
    entry->stage = stage;
    entry->affinity = AffinityScore(people[person], people[target]);
}

AttachAuditEntry IdentityResolver::ResolveOne(int person) const {
    AttachAuditEntry entry;
    entry.person = person;
    entry.attach_text = people[person].attach_text;

    if (IsCohortReference(entry.attach_text)) {
        entry.stage = ResolutionStage::kCohortReference;
        entry.caveat = true;
        entry.message = absl::StrFormat(
            "Skipped: '%s' appears to be a group/org reference, not a person name",
            entry.attach_text);
        return entry;
    }

    const string key = NormalizeReference(entry.attach_text);
    const vector<string> tokens = Tokens(key);

    if (TryExact(person, key, ResolutionStage::kExactMatch, &entry)) return entry;

    unordered_set<int> rejected;
    if (tokens.size() >= 2) {
        vector<string> expanded = tokens;
        expanded.front() = Nickname(tokens.front());
        const string expanded_key = absl::StrJoin(expanded, " ");
        if (expanded_key != key &&
            TryExact(person, expanded_key, ResolutionStage::kNickname, &entry)) {
            return entry;
        }
        if (TryLastName(person, tokens, &rejected, &entry)) return entry;
    }
    if (tokens.size() == 1 && TryFirstName(person, tokens.front(), &entry)) return entry;
    if (tokens.size() >= 2 &&
        static_cast<int>(tokens.back().size()) <= options.short_prefix_max_length() &&
        TryPrefix(person, tokens, &entry)) {
        return entry;
    }

    FuzzyOrUnresolved(person, key, rejected, &entry);
    return entry;
}

bool IdentityResolver::TryExact(int person, const string& key, ResolutionStage stage,
                                AttachAuditEntry* entry) const {
    vector<int> candidates;
    for (int j = 0; j < static_cast<int>(people.size()); ++j) {
        if (j != person && name_keys[j] == key) candidates.push_back(j);
    }
    if (candidates.empty()) return false;

    int best = PickByAffinity(people, person, candidates);
    if (best == kUnassigned) {
        entry->notes.push_back(absl::StrFormat(
            "'%s' names %d people with no org/group affinity; ambiguous",
            key, candidates.size()));
        return false;
    }

    Accept(person, best, stage, entry);
    entry->raw_similarity = 1.0;
    entry->candidate_count = static_cast<int>(candidates.size());
    const char* how = stage == ResolutionStage::kNickname ? "Nickname" : "Exact";
    if (candidates.size() > 1) {
        entry->caveat = true;
        entry->message = absl::StrFormat("%s match to '%s' (picked from %d candidates, affinity=%d)",
                                         how, people[best].FullName(), candidates.size(),
                                         entry->affinity);
    } else {
        entry->message = absl::StrFormat("%s match to '%s'", how, people[best].FullName());
    }
    return true;
}

bool IdentityResolver::TryLastName(int person, const vector<string>& tokens,
                                   unordered_set<int>* rejected,
                                   AttachAuditEntry* entry) const {
    const string& first = tokens.front();
    const string& last = tokens.back();

    vector<int> candidates;
    for (int j = 0; j < static_cast<int>(people.size()); ++j) {
        if (j != person && !last_tokens[j].empty() && last_tokens[j] == last) {
            candidates.push_back(j);
        }
    }
    int best = PickByAffinity(people, person, candidates);
    if (best == kUnassigned) return false;

    const string& candidate_first = first_tokens[best];
    const double first_similarity = SimilarityRatio(first, candidate_first);
    const int affinity = AffinityScore(people[person], people[best]);
    const bool nickname_of = Nickname(first) == candidate_first;

    if (first_similarity >= options.last_name_first_similarity() || affinity > 0 || nickname_of) {
        Accept(person, best, ResolutionStage::kLastName, entry);
        entry->raw_similarity = first_similarity;
        entry->candidate_count = static_cast<int>(candidates.size());
        entry->caveat = candidates.size() > 1 ||
                        first_similarity < options.last_name_first_similarity();
        entry->message = absl::StrFormat(
            "Last-name matched to '%s' (picked from %d candidates, sim=%.2f, affinity=%d)",
            people[best].FullName(), candidates.size(), first_similarity, affinity);
        return true;
    }

    entry->notes.push_back(absl::StrFormat(
        "Last-name match rejected: '%s' vs '%s' (sim=%.2f, affinity=%d); likely different person",
        first, candidate_first, first_similarity, affinity));
    rejected->insert(best);
    return false;
}

bool IdentityResolver::TryFirstName(int person, const string& first,
                                    AttachAuditEntry* entry) const {
    vector<int> candidates;
    for (int j = 0; j < static_cast<int>(people.size()); ++j) {
        if (j != person && !first_tokens[j].empty() && first_tokens[j] == first) {
            candidates.push_back(j);
        }
    }
    int best = PickByAffinity(people, person, candidates);
    if (best == kUnassigned) return false;

    Accept(person, best, ResolutionStage::kFirstName, entry);
    entry->raw_similarity = SimilarityRatio(first, name_keys[best]);
    entry->candidate_count = static_cast<int>(candidates.size());
    entry->caveat = true;
    entry->message = absl::StrFormat("First-name matched to '%s' (from %d candidates, affinity=%d)",
                                     people[best].FullName(), candidates.size(), entry->affinity);
    return true;
}

bool IdentityResolver::TryPrefix(int person, const vector<string>& tokens,
                                 AttachAuditEntry* entry) const {
    const string& first = tokens.front();
    const string& prefix = tokens.back();

    vector<int> candidates;
    for (int j = 0; j < static_cast<int>(people.size()); ++j) {
        if (j == person || first_tokens[j] != first || last_tokens[j].empty()) continue;
        if (absl::StartsWith(last_tokens[j], prefix)) candidates.push_back(j);
    }
    int best = PickByAffinity(people, person, candidates);
    if (best == kUnassigned) return false;

    Accept(person, best, ResolutionStage::kLastNamePrefix, entry);
    entry->raw_similarity = SimilarityRatio(absl::StrJoin(tokens, " "), name_keys[best]);
    entry->candidate_count = static_cast<int>(candidates.size());
    entry->caveat = true;
    entry->message = absl::StrFormat("Prefix matched to '%s' (from %d candidates, affinity=%d)",
                                     people[best].FullName(), candidates.size(), entry->affinity);
    return true;
}

void IdentityResolver::FuzzyOrUnresolved(int person, const string& key,
                                         const unordered_set<int>& rejected,
                                         AttachAuditEntry* entry) const {
    double best_combined = 0.0;
    double best_raw = 0.0;
    int best = kUnassigned;
    int considered = 0;

    for (int j = 0; j < static_cast<int>(people.size()); ++j) {
        if (j == person || rejected.count(j) > 0 || name_keys[j].empty()) continue;
        ++considered;
        const double raw = SimilarityRatio(key, name_keys[j]);
        const int affinity = AffinityScore(people[person], people[j]);
        const double combined = raw + affinity * options.affinity_boost();
        if (combined > best_combined || (combined == best_combined && raw > best_raw)) {
            best_combined = combined;
            best_raw = raw;
            best = j;
        }
    }

    const int affinity = best != kUnassigned ? AffinityScore(people[person], people[best]) : 0;
    const double threshold = affinity > 0 ? options.fuzzy_threshold_with_affinity()
                                          : options.fuzzy_threshold_without_affinity();
    entry->raw_similarity = best_raw;
    entry->affinity = affinity;
    entry->candidate_count = considered;

    if (best != kUnassigned && best_raw >= threshold) {
        Accept(person, best, ResolutionStage::kFuzzy, entry);
        entry->caveat = best_raw < options.fuzzy_caveat_threshold();
        entry->message = absl::StrFormat(
            "Fuzzy matched to '%s' (raw=%.2f, affinity=%d, combined=%.2f)",
            people[best].FullName(), best_raw, affinity, best_combined);
        return;
    }

    entry->stage = ResolutionStage::kUnresolved;
    entry->target = kUnassigned;
    entry->caveat = true;
    entry->message = absl::StrFormat("UNRESOLVED: No match found for '%s' (best raw=%.2f, affinity=%d)",
                                     entry->attach_text, best_raw, affinity);
}

}  // namespace retreat_placer
