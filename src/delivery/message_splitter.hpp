#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tfbot::delivery {

// Splits content into ordered chunks of at most max_length bytes. Splitting
// is lossless: the chunks concatenate back to the input. Break preference is
// paragraph, then sentence, then word, then a forced cut that never lands
// inside a UTF-8 sequence. A cut that would fall inside a ``` block moves to
// the start of that block when it can.
std::vector<std::string> SplitMessage(const std::string& content, std::size_t max_length);

std::string PartHeader(std::size_t index, std::size_t total);

// Prefixes "[Part i/N]\n" to every chunk when there is more than one.
std::vector<std::string> AddPartHeaders(const std::vector<std::string>& chunks);

}  // namespace tfbot::delivery
