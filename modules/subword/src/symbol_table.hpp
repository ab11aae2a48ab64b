/**
 * @file symbol_table.hpp
 * @brief Bidirectional mapping between token identifiers and token content
 */

#ifndef OPENCV_SUBWORD_SYMBOL_TABLE_HPP
#define OPENCV_SUBWORD_SYMBOL_TABLE_HPP

#include <string>
#include <unordered_map>
#include <vector>

namespace cv {
namespace subword {

/**
 * @brief Dense id <-> content table
 *
 * Identifiers are assigned in insertion order starting from 0 and are never
 * reused. Content is an arbitrary byte string.
 */
class SymbolTable {
public:
    /**
     * @brief Adds new content
     * @return The new identifier, or -1 if the content is already present
     */
    int add(const std::string& content);

    /** @brief Returns the identifier of the content, or -1 */
    int find(const std::string& content) const;

    bool contains(int id) const { return id >= 0 && static_cast<size_t>(id) < contents_.size(); }

    /** @brief Content of an identifier; the identifier must be valid */
    const std::string& content(int id) const;

    size_t size() const { return contents_.size(); }

    const std::vector<std::string>& contents() const { return contents_; }

private:
    std::vector<std::string> contents_;
    std::unordered_map<std::string, int> ids_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_SYMBOL_TABLE_HPP
