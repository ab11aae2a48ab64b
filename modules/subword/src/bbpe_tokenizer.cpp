/**
 * @file bbpe_tokenizer.cpp
 * @brief Implementation of the byte-level BPE tokenizer
 */

#include "precomp.hpp"
#include "bbpe_tokenizer.hpp"
#include "byte_level.hpp"

namespace cv {
namespace subword {

namespace {

std::vector<std::string> allBytes() {
    std::vector<std::string> bytes;
    bytes.reserve(256);
    for (int b = 0; b < 256; ++b) {
        bytes.push_back(std::string(1, static_cast<char>(b)));
    }
    return bytes;
}

} // namespace

BBPETokenizer::BBPETokenizer(const TokenizerParams& params)
    : BPETokenizer(params) {
    Model model;
    for (const auto& b : allBytes()) {
        model.symbols.add(b);
    }
    model.scores.assign(256, 1.0);
    setModel(model);
}

std::vector<std::string> BBPETokenizer::buildAlphabet(const std::vector<SpanCount>&) const {
    return allBytes();
}

void BBPETokenizer::onModelChanged() {
    BPETokenizer::onModelChanged();
    for (int b = 0; b < 256; ++b) {
        byteIds_[b] = model_.symbols.find(std::string(1, static_cast<char>(b)));
        CV_Assert(byteIds_[b] >= 0);
    }
}

void BBPETokenizer::encodeSpan(const std::string& span, std::vector<int>& ids) const {
    std::vector<int> symbols;
    symbols.reserve(span.size());
    for (unsigned char b : span) {
        symbols.push_back(byteIds_[b]);
    }
    applyMerges(symbols);
    ids.insert(ids.end(), symbols.begin(), symbols.end());
}

std::string BBPETokenizer::toDisplay(const std::string& content) const {
    return bytesToDisplay(content);
}

bool BBPETokenizer::fromDisplay(const std::string& text, std::string& content) const {
    return displayToBytes(text, content);
}

Ptr<Tokenizer> createBBPETokenizer(const TokenizerParams& params) {
    return makePtr<BBPETokenizer>(params);
}

}} // namespace cv::subword
