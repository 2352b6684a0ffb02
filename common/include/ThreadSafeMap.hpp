#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный словарь документов
 * @details
 * Хранит значения как std::shared_ptr<V>: читатель получает снимок документа,
 * который не меняется при последующих insert() по тому же ключу.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    /**
     * @brief Вставить только если ключ отсутствует
     * @return true если значение вставлено
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Снимок всех значений, удовлетворяющих предикату
     */
    std::vector<std::shared_ptr<V>> select(const std::function<bool(const V &)> &predicate) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        for (const auto &entry : map_)
        {
            if (predicate(*entry.second))
            {
                result.push_back(entry.second);
            }
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
