#include <gtest/gtest.h>
#include <parexec/aho_corasick.hh>
#include <string>
#include <vector>

using std::string;
using std::vector;

namespace {

// Returns (end position, pattern id) of every occurrence of every pattern
vector<std::pair<size_t, unsigned>> all_matches(const AhoCorasick& ac, const string& text) {
    vector<std::pair<size_t, unsigned>> res;
    auto ends = ac.search_in(text);
    for (size_t i = 0; i < ends.size(); ++i) {
        for (auto node = ends[i]; node != 0; node = ac.next_pattern(node)) {
            res.emplace_back(i, ac.pattern_id(node));
        }
    }
    return res;
}

} // namespace

// NOLINTNEXTLINE
TEST(aho_corasick, search_in) {
    AhoCorasick ac;
    ac.add_pattern("he", 1);
    ac.add_pattern("she", 2);
    ac.add_pattern("his", 3);
    ac.add_pattern("hers", 4);
    ac.build_fail_edges();

    using P = std::pair<size_t, unsigned>;
    EXPECT_EQ(all_matches(ac, "ushers"), (vector<P>{{3, 2}, {3, 1}, {5, 4}}));
    EXPECT_EQ(all_matches(ac, "ahishers"), (vector<P>{{3, 3}, {5, 2}, {5, 1}, {7, 4}}));
    EXPECT_EQ(all_matches(ac, "xyz"), vector<P>{});
    EXPECT_EQ(all_matches(ac, ""), vector<P>{});
}

// NOLINTNEXTLINE
TEST(aho_corasick, overriding_pattern_id) {
    AhoCorasick ac;
    ac.add_pattern("x", 1);
    ac.add_pattern("x", 2);
    ac.build_fail_edges();
    auto ends = ac.search_in("axa");
    EXPECT_EQ(ends[0], 0);
    EXPECT_EQ(ac.pattern_id(ends[1]), 2);
    EXPECT_EQ(ends[2], 0);
}
