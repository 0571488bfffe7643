#pragma once

#include <string_view>
#include <utility>
#include <vector>

class AhoCorasick {
public:
    using uint = unsigned int;

    struct Node {
        uint patt_id = 0; // pattern id which ends in this node or zero if such
                          // does not exist
        uint fail = 0; // fail edge
        uint next_pattern = 0; // id of the node of the longest pattern which is
                               // a proper suffix of the one ending in this node
                               // or zero if such does not exist
        std::vector<std::pair<char, uint>> sons; // sons (sorted array - for
                                                 // small alphabets it's the
                                                 // most efficient option)

        // Returns id of son @p c or 0 if such does not exist
        uint operator[](char c) const noexcept;
    };

private:
    std::vector<Node> nodes = {Node{}}; // root

    // Returns id of son @p c (creates one if such does not exist)
    uint son(uint id, char c);

public:
    // Adds pattern s to structure and sets (override if such pattern has
    // already existed) its id to @p id, @p id equal to 0 disables the pattern,
    // pattern cannot be empty
    void add_pattern(std::string_view patt, uint id);

    // Returns id of the pattern which ends in node @p node_id
    [[nodiscard]] uint pattern_id(uint node_id) const noexcept { return nodes[node_id].patt_id; }

    // Returns id of next pattern node for pattern which ends in node @p
    // node_id
    [[nodiscard]] uint next_pattern(uint node_id) const noexcept {
        return nodes[node_id].next_pattern;
    }

    // Builds fail edges (have to be invoked before calls to search_in())
    void build_fail_edges();

    // Returns for every position of @p text the id of node in which the
    // longest pattern ending at this position ends (0 if there is no such)
    [[nodiscard]] std::vector<uint> search_in(std::string_view text) const;
};
