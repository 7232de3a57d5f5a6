#include "../include/link_channel.hpp"

std::shared_ptr<LinkChannel> ChannelSlot::current() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return channel_;
}

void ChannelSlot::replace(std::shared_ptr<LinkChannel> channel) {
    std::lock_guard<std::mutex> lock(mtx_);
    channel_ = std::move(channel);
}

std::shared_ptr<LinkChannel> ChannelSlot::take() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::shared_ptr<LinkChannel> out;
    out.swap(channel_);
    return out;
}

void ChannelSlot::clear_if(const std::shared_ptr<LinkChannel>& channel) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (channel_ == channel) channel_.reset();
}

bool ChannelSlot::send(const std::string& text) {
    std::shared_ptr<LinkChannel> snapshot = current();
    if (!snapshot || !snapshot->is_open()) return false;
    std::lock_guard<std::mutex> lock(send_mtx_);
    return snapshot->send_text(text);
}
