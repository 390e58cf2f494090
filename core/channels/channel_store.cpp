/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/channel_store.hpp"

namespace paychan::channels {
  outcome::result<void> ChannelStore::insert(ChannelRecord record) {
    auto id{record.channel.id};
    std::unique_lock lock{mutex_};
    if (entries_.count(id) != 0) {
      return ChannelError::kDuplicateChannel;
    }
    entries_.emplace(id, std::make_shared<Entry>(std::move(record)));
    return outcome::success();
  }

  outcome::result<Channel> ChannelStore::get(const ChannelId &id) const {
    OUTCOME_TRY(record, getRecord(id));
    return std::move(record.channel);
  }

  outcome::result<ChannelRecord> ChannelStore::getRecord(
      const ChannelId &id) const {
    auto entry{find(id)};
    if (!entry) {
      return ChannelError::kChannelNotFound;
    }
    std::lock_guard lock{entry->mutex};
    return entry->record;
  }

  bool ChannelStore::has(const ChannelId &id) const {
    return find(id) != nullptr;
  }

  std::vector<Channel> ChannelStore::list() const {
    return list([](const Channel &) { return true; });
  }

  std::vector<Channel> ChannelStore::list(const Filter &filter) const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
      std::shared_lock lock{mutex_};
      entries.reserve(entries_.size());
      for (const auto &it : entries_) {
        entries.push_back(it.second);
      }
    }
    std::vector<Channel> channels;
    for (const auto &entry : entries) {
      std::lock_guard lock{entry->mutex};
      if (filter(entry->record.channel)) {
        channels.push_back(entry->record.channel);
      }
    }
    return channels;
  }

  std::vector<Channel> ChannelStore::listBySender(const Address &sender) const {
    return list(
        [&](const Channel &channel) { return channel.sender == sender; });
  }

  std::vector<Channel> ChannelStore::listByRecipient(
      const Address &recipient) const {
    return list(
        [&](const Channel &channel) { return channel.recipient == recipient; });
  }

  std::vector<Channel> ChannelStore::listOpen() const {
    return list([](const Channel &channel) {
      return channel.state == ChannelState::kOpen;
    });
  }

  size_t ChannelStore::size() const {
    std::shared_lock lock{mutex_};
    return entries_.size();
  }

  std::shared_ptr<ChannelStore::Entry> ChannelStore::find(
      const ChannelId &id) const {
    std::shared_lock lock{mutex_};
    auto it{entries_.find(id)};
    if (it == entries_.end()) {
      return nullptr;
    }
    return it->second;
  }
}  // namespace paychan::channels
