/**
 * @file symbol_table.cpp
 * @brief Bidirectional content/identifier table
 */

#include "precomp.hpp"
#include "symbol_table.hpp"

namespace cv {
namespace subword {

int SymbolTable::add(const std::string& content) {
    if (ids_.count(content)) {
        return -1;
    }
    const int id = static_cast<int>(contents_.size());
    contents_.push_back(content);
    ids_.emplace(content, id);
    return id;
}

int SymbolTable::find(const std::string& content) const {
    auto it = ids_.find(content);
    return it != ids_.end() ? it->second : -1;
}

const std::string& SymbolTable::content(int id) const {
    CV_Assert(contains(id));
    return contents_[id];
}

}} // namespace cv::subword
