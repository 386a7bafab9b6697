#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Таблица мьютексов по ключу
 *
 * Мьютекс ключа создаётся при первом захвате и удаляется, когда
 * последний владелец или ожидающий его отпускает, поэтому таблица
 * содержит только ключи, которые сейчас кто-то держит или ждёт.
 * Несколько ключей всегда захватываются в порядке Less, поэтому две
 * операции над одними и теми же ключами не могут взаимно заблокироваться.
 *
 * @example
 * ```cpp
 * KeyedMutex<std::string> locks;
 * {
 *     auto guard = locks.lockAll({"b", "a"});  // захват: "a", затем "b"
 *     guard.holds("a");                        // true
 *     locks.size();                            // 2
 * }
 * locks.size();                                // 0
 * ```
 */
template <typename K, typename Hash = std::hash<K>, typename Less = std::less<K>>
class KeyedMutex
{
    struct Slot
    {
        std::mutex mutex;
        size_t holders = 0;  ///< владельцы + ожидающие, под tableMutex_
    };

public:
    /**
     * @brief RAII-владение набором захваченных ключей
     */
    class MultiLock
    {
    public:
        MultiLock() = default;

        MultiLock(MultiLock &&other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)),
              keys_(std::move(other.keys_)),
              slots_(std::move(other.slots_))
        {
            other.keys_.clear();
            other.slots_.clear();
        }

        MultiLock &operator=(MultiLock &&other) noexcept
        {
            if (this != &other)
            {
                unlock();
                owner_ = std::exchange(other.owner_, nullptr);
                keys_ = std::move(other.keys_);
                slots_ = std::move(other.slots_);
                other.keys_.clear();
                other.slots_.clear();
            }
            return *this;
        }

        MultiLock(const MultiLock &) = delete;
        MultiLock &operator=(const MultiLock &) = delete;

        ~MultiLock()
        {
            unlock();
        }

        bool holds(const K &key) const
        {
            return std::binary_search(keys_.begin(), keys_.end(), key, Less{});
        }

        const std::vector<K> &keys() const { return keys_; }

        /**
         * @brief Отпустить ключи в обратном порядке
         */
        void unlock()
        {
            for (size_t i = slots_.size(); i-- > 0;)
            {
                slots_[i]->mutex.unlock();
                owner_->release(keys_[i]);
            }
            slots_.clear();
            keys_.clear();
            owner_ = nullptr;
        }

    private:
        friend class KeyedMutex;

        KeyedMutex *owner_ = nullptr;
        std::vector<K> keys_;
        std::vector<std::shared_ptr<Slot>> slots_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex &) = delete;
    KeyedMutex &operator=(const KeyedMutex &) = delete;

    MultiLock lock(const K &key)
    {
        return lockAll({key});
    }

    /**
     * @brief Захватить все ключи в глобальном порядке
     *
     * Дубликаты схлопываются: ключ захватывается один раз.
     */
    MultiLock lockAll(std::vector<K> keys)
    {
        std::sort(keys.begin(), keys.end(), Less{});
        keys.erase(std::unique(keys.begin(), keys.end(),
                               [](const K &a, const K &b)
                               { return !Less{}(a, b) && !Less{}(b, a); }),
                   keys.end());

        MultiLock guard;
        guard.owner_ = this;
        guard.keys_.reserve(keys.size());
        guard.slots_.reserve(keys.size());
        for (const auto &key : keys)
        {
            auto slot = acquire(key);
            try
            {
                slot->mutex.lock();
            }
            catch (const std::system_error &)
            {
                release(key);
                throw;
            }
            guard.keys_.push_back(key);
            guard.slots_.push_back(std::move(slot));
        }
        return guard;
    }

    /**
     * @brief Сколько ключей сейчас захвачено или ожидается
     */
    size_t size() const
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        return slots_.size();
    }

private:
    mutable std::mutex tableMutex_;
    std::unordered_map<K, std::shared_ptr<Slot>, Hash> slots_;

    std::shared_ptr<Slot> acquire(const K &key)
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto &slot = slots_[key];
        if (!slot)
        {
            slot = std::make_shared<Slot>();
        }
        ++slot->holders;
        return slot;
    }

    void release(const K &key)
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto it = slots_.find(key);
        if (it != slots_.end() && --it->second->holders == 0)
        {
            slots_.erase(it);
        }
    }
};
