#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный реестр объектов по ключу
 * @details
 * Значения хранятся через std::shared_ptr: объект, выданный наружу, живёт
 * независимо от реестра. Чтение под shared_lock, создание под unique_lock.
 *
 * Используется как реестр мьютексов счетов в AccountLedger:
 * getOrCreate() гарантирует, что для одного ключа существует ровно один объект.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    /**
     * @brief Найти значение или создать его конструктором по умолчанию
     *
     * Быстрый путь под shared_lock, создание под unique_lock с повторной проверкой.
     * Два потока с одним ключом всегда получают один и тот же объект.
     */
    std::shared_ptr<V> getOrCreate(const K &key)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
            {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            return it->second;
        }
        auto value = std::make_shared<V>();
        map_.emplace(key, value);
        return value;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
