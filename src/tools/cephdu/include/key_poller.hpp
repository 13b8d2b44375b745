#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace cephdu
{

// Answers a listing's cancellation poll from the keyboard. Every interval-th
// poll reads one key; a cancel key stops the load and any other key is kept
// for the caller to replay once the load is over.
template <typename Key>
class KeyPoller
{
public:
    using ReadKey = std::function<std::optional<Key>()>;
    using IsCancel = std::function<bool(const Key &)>;

    KeyPoller(std::size_t interval, ReadKey readKey, IsCancel isCancel)
        : interval(interval == 0 ? 1 : interval), readKey(std::move(readKey)), isCancel(std::move(isCancel))
    {
    }

    bool poll()
    {
        if (++polls % interval != 0)
            return false;
        std::optional<Key> key = readKey();
        if (!key)
            return false;
        if (isCancel(*key))
            return true;
        pending.push_back(std::move(*key));
        return false;
    }

    // Keys read since the last call, oldest first.
    std::vector<Key> takePending()
    {
        std::vector<Key> keys;
        keys.swap(pending);
        return keys;
    }

private:
    std::size_t interval;
    std::size_t polls = 0;
    ReadKey readKey;
    IsCancel isCancel;
    std::vector<Key> pending;
};

} // namespace cephdu
