#pragma once

#include <string>

#include "bus/events.hpp"

namespace tfbot::coordinator {

// Removes <@id> and <@!id> mentions of the bot and trims the rest.
std::string ExtractQuery(const std::string& content, const std::string& bot_user_id);

// Slash commands carry "<command> <options...>"; the command name is dropped.
std::string ExtractEventQuery(const bus::InboundEvent& event, const std::string& bot_user_id);

// Replaces "{seconds}" in a user-visible template.
std::string FormatWait(const std::string& templ, int seconds);

}  // namespace tfbot::coordinator
