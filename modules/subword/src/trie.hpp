/**
 * @file trie.hpp
 * @brief Byte trie for longest-match and common-prefix vocabulary lookups
 */

#ifndef OPENCV_SUBWORD_TRIE_HPP
#define OPENCV_SUBWORD_TRIE_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cv {
namespace subword {

/**
 * @brief Byte-level prefix tree mapping keys to token identifiers
 *
 * Lookups descend one node per matched byte, independent of the number of
 * stored keys.
 */
class Trie {
public:
    Trie();

    /** @brief Inserts or overwrites a key */
    void insert(const std::string& key, int value);

    void clear();

    /**
     * @brief Longest key that is a prefix of text starting at pos
     * @param text Input text
     * @param pos Start offset
     * @param value Receives the identifier of the match
     * @param length Receives the byte length of the match
     * @return false if no key matches
     */
    bool longestMatch(const std::string& text, size_t pos, int& value, size_t& length) const;

    /**
     * @brief All keys that are prefixes of text starting at pos
     * @param text Input text
     * @param pos Start offset
     * @param matches Receives (identifier, byte length) pairs in increasing length
     */
    void commonPrefixSearch(const std::string& text, size_t pos,
                            std::vector<std::pair<int, size_t> >& matches) const;

private:
    struct Node {
        Node() : value(-1) {}
        std::map<unsigned char, int> children;
        int value;
    };

    std::vector<Node> nodes_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_TRIE_HPP
