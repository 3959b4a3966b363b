#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <functional>

/**
 * @brief Потокобезопасный словарь: много читателей, один писатель
 *
 * Значения хранятся по shared_ptr, find() возвращает снимок указателя.
 * Изменение значения на месте выполняется только через update().
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Копия значения (nullptr если ключа нет)
     */
    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? std::make_shared<V>(*it->second) : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Атомарно (под unique_lock) изменяет значение
     *
     * @return результат mutator или false, если ключа нет
     */
    bool update(const K &key, const std::function<bool(V &)> &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
            return false;
        return mutator(*it->second);
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Удаляет все записи, для которых predicate вернул true
     *
     * @return количество удалённых записей
     */
    size_t eraseIf(const std::function<bool(const V &)> &predicate)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();)
        {
            if (predicate(*it->second))
            {
                it = map_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
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
