#include <deque>
#include <parexec/aho_corasick.hh>

using std::vector;

AhoCorasick::uint AhoCorasick::Node::operator[](char c) const noexcept {
    uint beg = 0;
    uint end = sons.size();
    while (beg < end) {
        uint mid = (beg + end) >> 1;
        if (c < sons[mid].first) {
            end = mid;
        } else if (c == sons[mid].first) {
            return sons[mid].second;
        } else {
            beg = mid + 1;
        }
    }

    return 0;
}

AhoCorasick::uint AhoCorasick::son(uint id, char c) {
    uint beg = 0;
    uint end = nodes[id].sons.size();
    while (beg < end) {
        uint mid = (beg + end) >> 1;
        if (c < nodes[id].sons[mid].first) {
            end = mid;
        } else if (c == nodes[id].sons[mid].first) {
            return nodes[id].sons[mid].second;
        } else {
            beg = mid + 1;
        }
    }

    nodes.emplace_back();
    uint new_id = nodes.size() - 1;
    nodes[id].sons.emplace(nodes[id].sons.begin() + beg, c, new_id);
    return new_id;
}

void AhoCorasick::add_pattern(std::string_view patt, uint id) {
    uint curr = 0;
    for (char c : patt) {
        curr = son(curr, c);
    }
    nodes[curr].patt_id = id;
}

void AhoCorasick::build_fail_edges() {
    std::deque<uint> queue;
    for (auto&& p : nodes[0].sons) {
        nodes[p.second].fail = 0;
        nodes[p.second].next_pattern = 0;
        queue.emplace_back(p.second);
    }

    while (!queue.empty()) {
        uint curr = queue.front();
        queue.pop_front();
        for (auto&& p : nodes[curr].sons) {
            uint v = nodes[curr].fail;
            uint x = 0;
            while ((x = nodes[v][p.first]) == 0 && v) {
                v = nodes[v].fail;
            }
            nodes[p.second].fail = x;
            nodes[p.second].next_pattern = (nodes[x].patt_id ? x : nodes[x].next_pattern);
            queue.emplace_back(p.second);
        }
    }
}

vector<AhoCorasick::uint> AhoCorasick::search_in(std::string_view text) const {
    vector<uint> res(text.size());
    uint curr = 0;
    uint x = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        while ((x = nodes[curr][c]) == 0 && curr) {
            curr = nodes[curr].fail;
        }
        curr = x;
        res[i] = (nodes[curr].patt_id ? curr : nodes[curr].next_pattern);
    }

    return res;
}
