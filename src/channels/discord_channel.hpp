#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <dpp/dpp.h>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"
#include "platform/platform.hpp"

namespace tfbot::channels {

// Discord gateway adapter. Turns mentions and /ask into InboundEvents on the
// bus and serves the Platform operations with blocking REST calls, which
// must not be issued from a gateway callback.
class DiscordChannel : public ChannelBase, public platform::Platform {
public:
    using ReadyCallback = std::function<void(const std::string& bot_user_id)>;

    DiscordChannel(const tfbot::config::DiscordConfig& config,
                   const tfbot::config::ThreadsConfig& threads,
                   tfbot::bus::MessageBus& bus);
    ~DiscordChannel() override;

    void Start() override;
    void Stop() override;

    void SetReadyCallback(ReadyCallback callback) { on_ready_ = std::move(callback); }

    platform::MessageHandle SendMessage(const std::string& destination_id,
                                        const std::string& content,
                                        std::vector<bus::Attachment> attachments) override;
    platform::Thread CreateThread(const bus::InboundEvent& event, const std::string& name) override;
    std::optional<platform::Thread> FetchExistingThread(const bus::InboundEvent& event) override;
    void DeleteMessage(const platform::MessageHandle& handle) override;

private:
    void HandleMessageCreate(const dpp::message_create_t& event);
    void HandleSlashCommand(const dpp::slashcommand_t& event);
    void HandleReady(const dpp::ready_t& event);
    bool IsThreadChannel(dpp::snowflake channel_id) const;
    std::string BotUserId() const;

    tfbot::config::DiscordConfig config_;
    tfbot::config::ThreadsConfig threads_;
    std::unique_ptr<dpp::cluster> cluster_;
    ReadyCallback on_ready_;
    std::string bot_user_id_;
    mutable std::mutex mutex_;
};

}  // namespace tfbot::channels
