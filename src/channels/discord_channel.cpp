#include "channels/discord_channel.hpp"

#include <cstdint>
#include <utility>
#include <variant>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace tfbot::channels {
namespace {

constexpr const char* kTag = "discord";
constexpr const char* kAskCommand = "ask";
constexpr const char* kQueryOption = "query";

[[noreturn]] void Rethrow(const dpp::exception& e) {
    const std::string text = e.what();
    throw platform::PlatformError(platform::ClassifyError(text), text);
}

std::string SenderKey(const dpp::user& user) {
    auto key = user.id.str();
    if (!user.username.empty()) {
        key += "|" + user.username;
    }
    return key;
}

std::string DisplayName(const dpp::user& user) {
    return user.global_name.empty() ? user.username : user.global_name;
}

}  // namespace

DiscordChannel::DiscordChannel(const tfbot::config::DiscordConfig& config,
                               const tfbot::config::ThreadsConfig& threads,
                               tfbot::bus::MessageBus& bus)
    : ChannelBase("discord", bus, config.allow_from)
    , config_(config)
    , threads_(threads) {}

DiscordChannel::~DiscordChannel() {
    Stop();
}

void DiscordChannel::Start() {
    if (running_) {
        return;
    }
    if (config_.token.empty()) {
        utils::LogError(kTag, "token is empty; channel disabled");
        return;
    }

    cluster_ = std::make_unique<dpp::cluster>(
        config_.token,
        dpp::i_default_intents | dpp::i_message_content);

    cluster_->on_log([](const dpp::log_t& event) {
        if (event.severity >= dpp::ll_warning) {
            utils::LogWarn(kTag, event.message);
        } else if (event.severity >= dpp::ll_info) {
            utils::LogDebug(kTag, event.message);
        }
    });
    cluster_->on_ready([this](const dpp::ready_t& event) { HandleReady(event); });
    cluster_->on_message_create([this](const dpp::message_create_t& event) {
        HandleMessageCreate(event);
    });
    cluster_->on_slashcommand([this](const dpp::slashcommand_t& event) {
        HandleSlashCommand(event);
    });

    cluster_->start(dpp::st_return);
    running_ = true;
    utils::LogInfo(kTag, "gateway started");
}

void DiscordChannel::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    if (cluster_) {
        cluster_->shutdown();
    }
    utils::LogInfo(kTag, "gateway stopped");
}

void DiscordChannel::HandleReady(const dpp::ready_t&) {
    const auto bot_id = cluster_->me.id.str();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bot_user_id_ = bot_id;
    }
    utils::LogInfo(kTag, "connected as " + cluster_->me.username + " (" + bot_id + ")");

    if (dpp::run_once<struct register_ask_command>()) {
        dpp::slashcommand ask(kAskCommand, "Ask the bot a question", cluster_->me.id);
        ask.add_option(dpp::command_option(dpp::co_string, kQueryOption, "Your question", true));
        cluster_->global_command_create(ask, [](const dpp::confirmation_callback_t& result) {
            if (result.is_error()) {
                utils::LogWarn(kTag, "could not register /ask: " + result.get_error().human_readable);
            }
        });
    }

    if (on_ready_) {
        on_ready_(bot_id);
    }
}

std::string DiscordChannel::BotUserId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bot_user_id_;
}

bool DiscordChannel::IsThreadChannel(dpp::snowflake channel_id) const {
    const auto* channel = dpp::find_channel(channel_id);
    if (!channel) {
        return false;
    }
    const auto type = channel->get_type();
    return type == dpp::CHANNEL_PUBLIC_THREAD
        || type == dpp::CHANNEL_PRIVATE_THREAD
        || type == dpp::CHANNEL_ANNOUNCEMENT_THREAD;
}

void DiscordChannel::HandleMessageCreate(const dpp::message_create_t& event) {
    const auto& msg = event.msg;
    if (msg.author.is_bot()) {
        return;
    }
    const auto bot_id = BotUserId();
    bool mentioned = false;
    for (const auto& [user, member] : msg.mentions) {
        if (user.id.str() == bot_id) {
            mentioned = true;
            break;
        }
    }
    if (!mentioned) {
        return;
    }

    bus::InboundEvent inbound{};
    inbound.event_id = msg.id.str();
    inbound.author_id = msg.author.id.str();
    inbound.author_name = DisplayName(msg.author);
    inbound.channel_id = msg.channel_id.str();
    if (!msg.guild_id.empty()) {
        inbound.guild_id = msg.guild_id.str();
    }
    inbound.in_thread = IsThreadChannel(msg.channel_id);
    inbound.has_attachments = !msg.attachments.empty();
    inbound.kind = inbound.in_thread ? bus::EventKind::kThreadReply : bus::EventKind::kMention;
    inbound.content = msg.content;
    inbound.timestamp = utils::Now();

    utils::LogDebug(kTag, "mention " + inbound.event_id + " from " + inbound.author_id
        + " in " + inbound.channel_id);
    HandleEvent(inbound, SenderKey(msg.author));
}

void DiscordChannel::HandleSlashCommand(const dpp::slashcommand_t& event) {
    if (event.command.get_command_name() != kAskCommand) {
        return;
    }
    std::string query;
    const auto param = event.get_parameter(kQueryOption);
    if (std::holds_alternative<std::string>(param)) {
        query = std::get<std::string>(param);
    }

    const auto& user = event.command.get_issuing_user();
    bus::InboundEvent inbound{};
    inbound.event_id = event.command.id.str();
    inbound.author_id = user.id.str();
    inbound.author_name = DisplayName(user);
    inbound.channel_id = event.command.channel_id.str();
    if (!event.command.guild_id.empty()) {
        inbound.guild_id = event.command.guild_id.str();
    }
    inbound.in_thread = IsThreadChannel(event.command.channel_id);
    inbound.kind = bus::EventKind::kSlashCommand;
    inbound.content = std::string(kAskCommand) + " " + query;
    inbound.timestamp = utils::Now();

    event.reply(dpp::message("Working on it...").set_flags(dpp::m_ephemeral));
    HandleEvent(inbound, SenderKey(user));
}

platform::MessageHandle DiscordChannel::SendMessage(const std::string& destination_id,
                                                    const std::string& content,
                                                    std::vector<bus::Attachment> attachments) {
    if (!cluster_) {
        throw platform::PlatformError(platform::ErrorKind::kOther, "discord channel is not started");
    }
    dpp::message msg(dpp::snowflake(destination_id), content);
    msg.set_allowed_mentions(true, false, false, false, {}, {});
    msg.set_flags(dpp::m_suppress_embeds);
    for (auto& attachment : attachments) {
        msg.add_file(attachment.filename, std::move(attachment.data));
    }
    try {
        const auto sent = cluster_->message_create_sync(msg);
        return platform::MessageHandle{sent.id.str(), sent.channel_id.str()};
    } catch (const dpp::exception& e) {
        Rethrow(e);
    }
}

platform::Thread DiscordChannel::CreateThread(const bus::InboundEvent& event, const std::string& name) {
    if (!cluster_) {
        throw platform::PlatformError(platform::ErrorKind::kOther, "discord channel is not started");
    }
    const auto archive = static_cast<uint16_t>(threads_.auto_archive_minutes);
    try {
        dpp::thread created;
        if (event.kind == bus::EventKind::kSlashCommand) {
            // Interactions have no message to hang the thread on.
            created = cluster_->thread_create_sync(
                name, dpp::snowflake(event.channel_id), archive,
                dpp::CHANNEL_PUBLIC_THREAD, true, 0);
        } else {
            created = cluster_->thread_create_with_message_sync(
                name, dpp::snowflake(event.channel_id), dpp::snowflake(event.event_id), archive, 0);
        }
        return platform::Thread{created.id.str(), event.channel_id, created.name};
    } catch (const dpp::exception& e) {
        Rethrow(e);
    }
}

std::optional<platform::Thread> DiscordChannel::FetchExistingThread(const bus::InboundEvent& event) {
    if (!cluster_ || event.kind == bus::EventKind::kSlashCommand) {
        return std::nullopt;
    }
    // A thread started from a message shares the message's id.
    try {
        const auto channel = cluster_->channel_get_sync(dpp::snowflake(event.event_id));
        return platform::Thread{channel.id.str(), channel.parent_id.str(), channel.name};
    } catch (const dpp::exception& e) {
        const std::string text = e.what();
        if (platform::ClassifyError(text) == platform::ErrorKind::kNotFound) {
            return std::nullopt;
        }
        Rethrow(e);
    }
}

void DiscordChannel::DeleteMessage(const platform::MessageHandle& handle) {
    if (!cluster_) {
        throw platform::PlatformError(platform::ErrorKind::kOther, "discord channel is not started");
    }
    try {
        cluster_->message_delete_sync(dpp::snowflake(handle.id), dpp::snowflake(handle.channel_id));
    } catch (const dpp::exception& e) {
        Rethrow(e);
    }
}

}  // namespace tfbot::channels
