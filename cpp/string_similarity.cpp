#include "string_similarity.hpp"

#include <vector>

using namespace std;

namespace retreat_placer {

namespace {

struct Match {
    int i;
    int j;
    int size;
};

// Longest common block of a[alo, ahi) and b[blo, bhi). Ties keep the smallest
// i, then the smallest j.
Match FindLongestMatch(const string& a, int alo, int ahi,
                       const string& b, int blo, int bhi) {
    Match best{alo, blo, 0};
    // run[j + 1] = length of the common suffix ending at a[i - 1], b[j].
    vector<int> run(b.size() + 1, 0), next(b.size() + 1, 0);
    for (int i = alo; i < ahi; ++i) {
        for (int j = blo; j < bhi; ++j) {
            if (a[i] == b[j]) {
                int k = (j > blo ? run[j] : 0) + 1;
                next[j + 1] = k;
                if (k > best.size) {
                    best = {i - k + 1, j - k + 1, k};
                }
            } else {
                next[j + 1] = 0;
            }
        }
        run.swap(next);
    }
    return best;
}

}  // namespace

double SimilarityRatio(const string& a, const string& b) {
    const int total = static_cast<int>(a.size() + b.size());
    if (total == 0) return 1.0;

    int matched = 0;
    struct Span { int alo, ahi, blo, bhi; };
    vector<Span> pending = {{0, static_cast<int>(a.size()), 0, static_cast<int>(b.size())}};
    while (!pending.empty()) {
        Span s = pending.back();
        pending.pop_back();
        Match m = FindLongestMatch(a, s.alo, s.ahi, b, s.blo, s.bhi);
        if (m.size == 0) continue;
        matched += m.size;
        if (s.alo < m.i && s.blo < m.j) {
            pending.push_back({s.alo, m.i, s.blo, m.j});
        }
        if (m.i + m.size < s.ahi && m.j + m.size < s.bhi) {
            pending.push_back({m.i + m.size, s.ahi, m.j + m.size, s.bhi});
        }
    }
    return 2.0 * matched / total;
}

}  // namespace retreat_placer
