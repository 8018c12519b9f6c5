// tests/intrusive_rb_tree_invariant_stress.cpp
//
// Randomized differential tests for IntrusiveRBTree against std::set. Uses GoogleTest.
//
// - Runs multiple rounds, each performing many insert/remove/search/nsearch/psearch operations
//   over a fixed pool of elements (the tree never owns them).
// - Periodically validates:
//     * red-black invariants via validate_invariants()
//     * membership and ordering vs std::set
// - The seed is printed on failure so a run can be replayed.
//
// Stress intensity comes from env vars, falling back to the constants below:
//   INTRUSIVE_RB_STRESS_ROUNDS, INTRUSIVE_RB_STRESS_OPS, INTRUSIVE_RB_STRESS_KEYS, INTRUSIVE_RB_STRESS_SEED

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "intrusive_rb_tree.hpp"

struct Entry {
    int key = 0;
    RBNode<Entry> link;
};

std::ostream& operator<<(std::ostream& os, const Entry& e) { return os << e.key; }

struct EntryCompare {
    RBOrdering operator()(int k, const Entry& b) const { return RBDefaultCompare()(k, b.key); }
    RBOrdering operator()(const Entry& a, const Entry& b) const { return RBDefaultCompare()(a.key, b.key); }
};

using Tree = IntrusiveRBTree<Entry, RBMemberNode<Entry, &Entry::link>, EntryCompare>;

// Same order as EntryCompare, with "before" reported as Incomparable.
struct IncomparableBelowCompare {
    RBOrdering operator()(int k, const Entry& b) const {
        const RBOrdering o = RBDefaultCompare()(k, b.key);
        return o == RBOrdering::Less ? RBOrdering::Incomparable : o;
    }
    RBOrdering operator()(const Entry& a, const Entry& b) const { return (*this)(a.key, b); }
};

using IncomparableBelowTree = IntrusiveRBTree<Entry, RBMemberNode<Entry, &Entry::link>, IncomparableBelowCompare>;

static long env_or(const char* name, long fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    char* end = nullptr;
    long parsed = std::strtol(v, &end, 10);
    if (*end != '\0' || parsed <= 0) {
        std::cerr << "ignoring " << name << "=" << v << ", using " << fallback << "\n";
        return fallback;
    }
    return parsed;
}

static unsigned long long stress_seed() {
    const char* v = std::getenv("INTRUSIVE_RB_STRESS_SEED");
    if (v && *v) return std::strtoull(v, nullptr, 10);
    return (unsigned long long)std::chrono::high_resolution_clock::now().time_since_epoch().count();
}

// Pool of entries with key == index; addresses stay fixed for the whole test.
static std::vector<Entry> make_pool(int n) {
    std::vector<Entry> pool(n);
    for (int i = 0; i < n; ++i) pool[i].key = i;
    return pool;
}

static std::optional<int> ceiling_of(const std::set<int>& s, int k) {
    auto it = s.lower_bound(k);
    if (it == s.end()) return std::nullopt;
    return *it;
}

static std::optional<int> floor_of(const std::set<int>& s, int k) {
    auto it = s.upper_bound(k);
    if (it == s.begin()) return std::nullopt;
    return *std::prev(it);
}

static std::optional<int> key_of(const Entry* e) {
    if (!e) return std::nullopt;
    return e->key;
}

// Validate RB invariants and equality with std::set; returns diagnostic string (empty if ok)
template <typename TreeT>
static std::string validate_and_compare(TreeT& t, const std::set<int>& baseline) {
    std::string diag;
    if (!t.validate_invariants(&diag)) {
        std::ostringstream oss;
        oss << "Invariant validation failed:\n" << diag << "\n";
        return oss.str();
    }

    std::vector<int> v;
    t.iter([&](Entry& e) -> std::optional<int> { v.push_back(e.key); return std::nullopt; });
    std::vector<int> sv(baseline.begin(), baseline.end());
    if (v != sv) {
        std::ostringstream oss;
        oss << "Content mismatch: tree has " << v.size() << " elements, set has " << sv.size() << "\n";
        for (size_t i = 0; i < std::min(v.size(), sv.size()); ++i) {
            if (v[i] != sv[i]) {
                oss << "first difference at index " << i << ": tree=" << v[i] << " set=" << sv[i] << "\n";
                break;
            }
        }
        return oss.str();
    }

    if (baseline.empty() != t.empty()) return "empty() disagrees with std::set\n";
    if (key_of(t.first()) != (baseline.empty() ? std::nullopt : std::optional<int>(*baseline.begin())))
        return "first() disagrees with std::set\n";
    if (key_of(t.last()) != (baseline.empty() ? std::nullopt : std::optional<int>(*baseline.rbegin())))
        return "last() disagrees with std::set\n";
    return "";
}

TEST(StressFuzz, RandomizedOperationsMatchStdSet) {
    // Stress parameters - lower these if running on CI with limited time
    const long ROUNDS = env_or("INTRUSIVE_RB_STRESS_ROUNDS", 30);
    const long OPS_PER_ROUND = env_or("INTRUSIVE_RB_STRESS_OPS", 3000);
    const int KEY_RANGE = (int)env_or("INTRUSIVE_RB_STRESS_KEYS", 600);
    const unsigned long long seed = stress_seed();
    SCOPED_TRACE("seed=" + std::to_string(seed));

    std::vector<Entry> pool = make_pool(KEY_RANGE);
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> keydist(0, KEY_RANGE - 1);
    std::uniform_int_distribution<int> probedist(-10, KEY_RANGE + 10);
    std::uniform_int_distribution<int> opdist(0, 99);

    for (long round = 0; round < ROUNDS; ++round) {
        Tree t;
        std::set<int> baseline;

        for (long op = 0; op < OPS_PER_ROUND; ++op) {
            int k = keydist(rng);
            int action = opdist(rng);
            // Weighted operations:
            // 0-44 : insert if absent (45%)
            // 45-79: remove if present (35%)
            // 80-99: search / nsearch / psearch on a probe that may be out of range (20%)
            if (action < 45) {
                if (!baseline.count(k)) {
                    t.insert(&pool[k]);
                    baseline.insert(k);
                }
            } else if (action < 80) {
                if (baseline.count(k)) {
                    t.remove(&pool[k]);
                    baseline.erase(k);
                }
            } else {
                int probe = probedist(rng);
                Entry* found = t.search(probe);
                bool expected = baseline.count(probe) != 0;
                if ((found != nullptr) != expected || (found && found->key != probe)) {
                    FAIL() << "Round " << round << " op " << op << ": search(" << probe << ") disagrees";
                }
                if (key_of(t.nsearch(probe)) != ceiling_of(baseline, probe)) {
                    FAIL() << "Round " << round << " op " << op << ": nsearch(" << probe << ") disagrees";
                }
                if (key_of(t.psearch(probe)) != floor_of(baseline, probe)) {
                    FAIL() << "Round " << round << " op " << op << ": psearch(" << probe << ") disagrees";
                }
            }

            // periodically validate invariants and comparison
            if (op % 50 == 0) {
                std::string diag = validate_and_compare(t, baseline);
                if (!diag.empty()) {
                    FAIL() << "Round " << round << " op " << op << " failed:\n" << diag;
                }
            }
        } // ops loop

        std::string final_diag = validate_and_compare(t, baseline);
        if (!final_diag.empty()) {
            FAIL() << "Round " << round << " final validation failed:\n" << final_diag;
        }
    } // rounds
}

// Every single insert and remove is validated on a small key space, where the
// rebalancing cases near the root get hit most often.
TEST(StressFuzz, EveryOperationValidatedOnSmallTrees) {
    const unsigned long long seed = stress_seed();
    SCOPED_TRACE("seed=" + std::to_string(seed));
    const int KEY_RANGE = 40;
    std::vector<Entry> pool = make_pool(KEY_RANGE);
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> keydist(0, KEY_RANGE - 1);

    Tree t;
    std::set<int> baseline;
    for (int op = 0; op < 5000; ++op) {
        int k = keydist(rng);
        if (baseline.count(k)) {
            t.remove(&pool[k]);
            baseline.erase(k);
        } else {
            t.insert(&pool[k]);
            baseline.insert(k);
        }
        std::string diag = validate_and_compare(t, baseline);
        if (!diag.empty()) FAIL() << "op " << op << " key " << k << " failed:\n" << diag;
    }
}

TEST(StressFuzz, IncomparableOrderingMatchesStdSet) {
    const unsigned long long seed = stress_seed();
    SCOPED_TRACE("seed=" + std::to_string(seed));
    const int KEY_RANGE = 300;
    std::vector<Entry> pool = make_pool(KEY_RANGE);
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> keydist(0, KEY_RANGE - 1);
    std::uniform_int_distribution<int> probedist(-5, KEY_RANGE + 5);

    IncomparableBelowTree t;
    std::set<int> baseline;
    for (int op = 0; op < 4000; ++op) {
        int k = keydist(rng);
        if (baseline.count(k)) {
            t.remove(&pool[k]);
            baseline.erase(k);
        } else {
            t.insert(&pool[k]);
            baseline.insert(k);
        }

        int probe = probedist(rng);
        ASSERT_EQ(key_of(t.nsearch(probe)), ceiling_of(baseline, probe)) << "op " << op << " nsearch(" << probe << ")";
        ASSERT_EQ(key_of(t.psearch(probe)), floor_of(baseline, probe)) << "op " << op << " psearch(" << probe << ")";

        if (op % 25 == 0) {
            std::string diag = validate_and_compare(t, baseline);
            if (!diag.empty()) FAIL() << "op " << op << " failed:\n" << diag;
        }
    }

    std::vector<int> walked;
    for (Entry* e = t.first(); e != nullptr; e = t.next(e)) walked.push_back(e->key);
    EXPECT_TRUE(std::equal(walked.begin(), walked.end(), baseline.begin(), baseline.end()));
    std::vector<int> walked_back;
    for (Entry* e = t.last(); e != nullptr; e = t.prev(e)) walked_back.push_back(e->key);
    EXPECT_TRUE(std::equal(walked_back.begin(), walked_back.end(), baseline.rbegin(), baseline.rend()));
}

TEST(StressFuzz, NextPrevAgreeWithStdSet) {
    const unsigned long long seed = stress_seed();
    SCOPED_TRACE("seed=" + std::to_string(seed));
    const int KEY_RANGE = 2000;
    std::vector<Entry> pool = make_pool(KEY_RANGE);
    std::mt19937_64 rng(seed);
    std::bernoulli_distribution member(0.4);

    Tree t;
    std::set<int> baseline;
    for (int k = 0; k < KEY_RANGE; ++k) {
        if (member(rng)) {
            t.insert(&pool[k]);
            baseline.insert(k);
        }
    }

    for (int k : baseline) {
        auto it = baseline.find(k);
        auto nx = std::next(it);
        std::optional<int> expected_next = nx == baseline.end() ? std::nullopt : std::optional<int>(*nx);
        std::optional<int> expected_prev = it == baseline.begin() ? std::nullopt : std::optional<int>(*std::prev(it));
        ASSERT_EQ(key_of(t.next(&pool[k])), expected_next) << "next(" << k << ")";
        ASSERT_EQ(key_of(t.prev(&pool[k])), expected_prev) << "prev(" << k << ")";
    }

    std::vector<int> via_iterators;
    for (Entry& e : t) via_iterators.push_back(e.key);
    EXPECT_TRUE(std::equal(via_iterators.begin(), via_iterators.end(), baseline.begin(), baseline.end()));
}

TEST(StressFuzz, TraversalFromRandomStartMatchesBounds) {
    const unsigned long long seed = stress_seed();
    SCOPED_TRACE("seed=" + std::to_string(seed));
    const int KEY_RANGE = 1000;
    std::vector<Entry> pool = make_pool(KEY_RANGE);
    std::mt19937_64 rng(seed);
    std::bernoulli_distribution member(0.3);
    std::uniform_int_distribution<int> probedist(-5, KEY_RANGE + 5);

    Tree t;
    std::set<int> baseline;
    for (int k = 0; k < KEY_RANGE; ++k) {
        if (member(rng)) {
            t.insert(&pool[k]);
            baseline.insert(k);
        }
    }

    const size_t TAKE = 8;
    for (int i = 0; i < 500; ++i) {
        int probe = probedist(rng);

        std::vector<int> fwd;
        t.iter(probe, [&](Entry& e) -> std::optional<bool> {
            fwd.push_back(e.key);
            if (fwd.size() == TAKE) return true;
            return std::nullopt;
        });
        std::vector<int> fwd_expected;
        for (auto it = baseline.lower_bound(probe); it != baseline.end() && fwd_expected.size() < TAKE; ++it) {
            fwd_expected.push_back(*it);
        }
        ASSERT_EQ(fwd, fwd_expected) << "iter from " << probe;

        std::vector<int> rev;
        t.reverse_iter(probe, [&](Entry& e) -> std::optional<bool> {
            rev.push_back(e.key);
            if (rev.size() == TAKE) return true;
            return std::nullopt;
        });
        std::vector<int> rev_expected;
        for (auto it = std::make_reverse_iterator(baseline.upper_bound(probe));
             it != baseline.rend() && rev_expected.size() < TAKE; ++it) {
            rev_expected.push_back(*it);
        }
        ASSERT_EQ(rev, rev_expected) << "reverse_iter from " << probe;
    }
}

// Large fuzz test disabled by default - can be enabled locally when you want very long runs.
// Use GoogleTest filter to run specifically.
TEST(StressFuzz, DISABLED_LongRun) {
    const int KEY_RANGE = 100000;
    std::vector<Entry> pool = make_pool(KEY_RANGE);
    std::set<int> baseline;
    Tree t;
    const unsigned long long seed = stress_seed();
    SCOPED_TRACE("seed=" + std::to_string(seed));
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> keydist(0, KEY_RANGE - 1);
    for (int i = 0; i < 2000000; ++i) {
        int k = keydist(rng);
        if (i % 2 == 0) {
            if (!baseline.count(k)) {
                t.insert(&pool[k]);
                baseline.insert(k);
            }
        } else if (baseline.count(k)) {
            t.remove(&pool[k]);
            baseline.erase(k);
        }
        if (i % 10000 == 0) {
            std::string diag = validate_and_compare(t, baseline);
            if (!diag.empty()) FAIL() << "LongRun failure at iter " << i << ":\n" << diag;
        }
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
