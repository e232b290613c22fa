#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * @file KeyedMutex.hpp
 * @brief Взаимоисключение по строковому ключу
 * @details
 * Потоки с одинаковым ключом выполняются строго по одному, с разными ключами
 * параллельно. Запись о ключе удаляется, когда её больше никто не держит и
 * не ждёт, поэтому реестр не растёт с количеством запросов.
 *
 * @example
 * ```cpp
 * KeyedMutex keys;
 * {
 *     KeyedMutex::Guard guard(keys, "idem-42");
 *     // только один поток с ключом "idem-42" здесь
 * }
 *
 * // Ожидание с дедлайном: guard.owns() == false, если ключ не освободился вовремя
 * KeyedMutex::Guard timed(keys, "idem-42", std::chrono::steady_clock::now() + std::chrono::milliseconds(50));
 * ```
 */
class KeyedMutex
{
public:
    using Clock = std::chrono::steady_clock;

    class Guard
    {
    public:
        Guard(KeyedMutex &owner, std::string key)
            : owner_(owner), key_(std::move(key))
        {
            owner_.lock(key_);
            owns_ = true;
        }

        /// Без дедлайна ждёт без ограничения, как конструктор выше
        Guard(KeyedMutex &owner, std::string key, std::optional<Clock::time_point> until)
            : owner_(owner), key_(std::move(key))
        {
            if (until)
            {
                owns_ = owner_.tryLockUntil(key_, *until);
            }
            else
            {
                owner_.lock(key_);
                owns_ = true;
            }
        }

        ~Guard()
        {
            if (owns_)
            {
                owner_.unlock(key_);
            }
        }

        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;

        bool owns() const { return owns_; }

    private:
        KeyedMutex &owner_;
        std::string key_;
        bool owns_ = false;
    };

    size_t activeKeys() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry
    {
        bool held = false;
        size_t waiters = 0;
    };

    void lock(const std::string &key)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto &entry = entries_[key];
        ++entry.waiters;
        released_.wait(lock, [&entry]() { return !entry.held; });
        --entry.waiters;
        entry.held = true;
    }

    bool tryLockUntil(const std::string &key, Clock::time_point until)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto &entry = entries_[key];
        ++entry.waiters;
        bool acquired = released_.wait_until(lock, until, [&entry]() { return !entry.held; });
        --entry.waiters;
        if (acquired)
        {
            entry.held = true;
        }
        return acquired;
    }

    void unlock(const std::string &key)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end())
            {
                return;
            }
            it->second.held = false;
            if (it->second.waiters == 0)
            {
                entries_.erase(it);
            }
        }
        released_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_map<std::string, Entry> entries_;
};
