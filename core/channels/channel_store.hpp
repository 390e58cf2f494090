/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "channels/channel.hpp"
#include "channels/channel_error.hpp"

namespace paychan::channels {
  /**
   * Authoritative in-memory record of channels.
   * Each channel has its own lock, so mutations of one channel are serialized
   * and never wait for mutations of another channel.
   */
  class ChannelStore {
   public:
    using Filter = std::function<bool(const Channel &)>;

    /// @return kDuplicateChannel if id is already known
    outcome::result<void> insert(ChannelRecord record);

    outcome::result<Channel> get(const ChannelId &id) const;

    /// Snapshot of channel with history and counters
    outcome::result<ChannelRecord> getRecord(const ChannelId &id) const;

    bool has(const ChannelId &id) const;

    /**
     * Atomic read-modify-write of one channel.
     * Mutator runs on a copy of record under channel lock, the copy replaces
     * stored record only if mutator succeeds, so failed mutation leaves no
     * trace.
     * @param mutator - (ChannelRecord &) -> outcome::result<T>
     * @return mutator result or kChannelNotFound
     */
    template <typename F>
    auto update(const ChannelId &id, const F &mutator)
        -> decltype(mutator(std::declval<ChannelRecord &>())) {
      auto entry{find(id)};
      if (!entry) {
        return ChannelError::kChannelNotFound;
      }
      std::lock_guard lock{entry->mutex};
      auto record{entry->record};
      auto result{mutator(record)};
      if (result) {
        entry->record = std::move(record);
      }
      return result;
    }

    std::vector<Channel> list() const;

    std::vector<Channel> list(const Filter &filter) const;

    std::vector<Channel> listBySender(const Address &sender) const;

    std::vector<Channel> listByRecipient(const Address &recipient) const;

    std::vector<Channel> listOpen() const;

    size_t size() const;

   private:
    struct Entry {
      explicit Entry(ChannelRecord record) : record{std::move(record)} {}

      std::mutex mutex;
      ChannelRecord record;
    };

    std::shared_ptr<Entry> find(const ChannelId &id) const;

    mutable std::shared_mutex mutex_;
    std::map<ChannelId, std::shared_ptr<Entry>> entries_;
  };
}  // namespace paychan::channels
