#include "delivery/message_splitter.hpp"

#include <algorithm>

namespace tfbot::delivery {
namespace {

constexpr const char* kFence = "```";

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Last occurrence of needle starting in [from, before), or npos.
std::size_t FindLastBefore(const std::string& text, const std::string& needle,
                           std::size_t from, std::size_t before) {
    if (before <= from || before - from < needle.size()) {
        return std::string::npos;
    }
    const auto pos = text.rfind(needle, before - needle.size());
    if (pos == std::string::npos || pos < from) {
        return std::string::npos;
    }
    return pos;
}

// Start of the code block left open at `cut`, or npos when the cut is outside one.
std::size_t OpenFenceBefore(const std::string& text, std::size_t begin, std::size_t cut) {
    std::size_t open = std::string::npos;
    std::size_t pos = begin;
    while (true) {
        pos = text.find(kFence, pos);
        if (pos == std::string::npos || pos + 3 > cut) {
            break;
        }
        open = (open == std::string::npos) ? pos : std::string::npos;
        pos += 3;
    }
    return open;
}

std::size_t ChooseCut(const std::string& text, std::size_t begin, std::size_t max_length) {
    const auto limit = begin + max_length;
    const auto half = begin + max_length / 2;

    std::size_t cut = std::string::npos;
    const auto paragraph = FindLastBefore(text, "\n\n", begin, limit);
    if (paragraph != std::string::npos && paragraph > half) {
        cut = paragraph + 2;
    }
    if (cut == std::string::npos) {
        const auto sentence = FindLastBefore(text, ". ", begin, limit);
        if (sentence != std::string::npos && sentence > begin) {
            cut = sentence + 2;
        }
    }
    if (cut == std::string::npos) {
        const auto space = FindLastBefore(text, " ", half, limit);
        if (space != std::string::npos) {
            cut = space + 1;
        }
    }
    if (cut == std::string::npos) {
        cut = limit;
        while (cut > begin + 1 && IsContinuationByte(text[cut])) {
            --cut;
        }
    }

    const auto fence = OpenFenceBefore(text, begin, cut);
    if (fence != std::string::npos && fence > begin) {
        cut = fence;
    }
    return cut;
}

}  // namespace

std::vector<std::string> SplitMessage(const std::string& content, std::size_t max_length) {
    max_length = std::max<std::size_t>(max_length, 4);
    std::vector<std::string> chunks;
    if (content.size() <= max_length) {
        chunks.push_back(content);
        return chunks;
    }
    std::size_t begin = 0;
    while (begin < content.size()) {
        if (content.size() - begin <= max_length) {
            chunks.push_back(content.substr(begin));
            break;
        }
        const auto cut = ChooseCut(content, begin, max_length);
        chunks.push_back(content.substr(begin, cut - begin));
        begin = cut;
    }
    return chunks;
}

std::string PartHeader(std::size_t index, std::size_t total) {
    return "[Part " + std::to_string(index) + "/" + std::to_string(total) + "]\n";
}

std::vector<std::string> AddPartHeaders(const std::vector<std::string>& chunks) {
    if (chunks.size() <= 1) {
        return chunks;
    }
    std::vector<std::string> result;
    result.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        result.push_back(PartHeader(i + 1, chunks.size()) + chunks[i]);
    }
    return result;
}

}  // namespace tfbot::delivery
