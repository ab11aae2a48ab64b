/**
 * @file trie.cpp
 * @brief Byte trie for longest-match and prefix lookups
 */

#include "precomp.hpp"
#include "trie.hpp"

namespace cv {
namespace subword {

Trie::Trie() : nodes_(1) {}

void Trie::clear() {
    nodes_.assign(1, Node());
}

void Trie::insert(const std::string& key, int value) {
    CV_Assert(!key.empty());
    int node = 0;
    for (char ch : key) {
        const unsigned char c = static_cast<unsigned char>(ch);
        auto it = nodes_[node].children.find(c);
        if (it == nodes_[node].children.end()) {
            const int child = static_cast<int>(nodes_.size());
            nodes_[node].children.emplace(c, child);
            nodes_.push_back(Node());
            node = child;
        } else {
            node = it->second;
        }
    }
    nodes_[node].value = value;
}

bool Trie::longestMatch(const std::string& text, size_t pos, int& value, size_t& length) const {
    bool found = false;
    int node = 0;
    for (size_t i = pos; i < text.size(); ++i) {
        auto it = nodes_[node].children.find(static_cast<unsigned char>(text[i]));
        if (it == nodes_[node].children.end()) {
            break;
        }
        node = it->second;
        if (nodes_[node].value >= 0) {
            value = nodes_[node].value;
            length = i + 1 - pos;
            found = true;
        }
    }
    return found;
}

void Trie::commonPrefixSearch(const std::string& text, size_t pos,
                              std::vector<std::pair<int, size_t> >& matches) const {
    matches.clear();
    int node = 0;
    for (size_t i = pos; i < text.size(); ++i) {
        auto it = nodes_[node].children.find(static_cast<unsigned char>(text[i]));
        if (it == nodes_[node].children.end()) {
            return;
        }
        node = it->second;
        if (nodes_[node].value >= 0) {
            matches.push_back(std::make_pair(nodes_[node].value, i + 1 - pos));
        }
    }
}

}} // namespace cv::subword
