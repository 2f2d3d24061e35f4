#include "coordinator/query.hpp"

#include "utils/common.hpp"

namespace tfbot::coordinator {
namespace {

void EraseAll(std::string& text, const std::string& token) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.erase(pos, token.size());
    }
}

}  // namespace

std::string ExtractQuery(const std::string& content, const std::string& bot_user_id) {
    std::string query = content;
    if (!bot_user_id.empty()) {
        EraseAll(query, "<@" + bot_user_id + ">");
        EraseAll(query, "<@!" + bot_user_id + ">");
    }
    return utils::Trim(query);
}

std::string ExtractEventQuery(const bus::InboundEvent& event, const std::string& bot_user_id) {
    if (event.kind != bus::EventKind::kSlashCommand) {
        return ExtractQuery(event.content, bot_user_id);
    }
    const auto trimmed = utils::Trim(event.content);
    const auto space = trimmed.find_first_of(" \t\n");
    if (space == std::string::npos) {
        return {};
    }
    return ExtractQuery(trimmed.substr(space + 1), bot_user_id);
}

std::string FormatWait(const std::string& templ, int seconds) {
    static const std::string kPlaceholder = "{seconds}";
    std::string result = templ;
    const auto value = std::to_string(seconds);
    std::size_t pos = 0;
    while ((pos = result.find(kPlaceholder, pos)) != std::string::npos) {
        result.replace(pos, kPlaceholder.size(), value);
        pos += value.size();
    }
    return result;
}

}  // namespace tfbot::coordinator
