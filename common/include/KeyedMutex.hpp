#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file KeyedMutex.hpp
 * @brief Набор мьютексов, адресуемых строковым ключом
 * @details
 * Сериализует операции над одним объектом (проводка, план счетов компании) без глобальной
 * блокировки: разные ключи не мешают друг другу.
 *
 * Мьютексы создаются лениво и живут до уничтожения KeyedMutex.
 */
class KeyedMutex {
public:
    /**
     * @brief RAII-владение набором ключей
     */
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) noexcept = default;
        Guard& operator=(Guard&&) noexcept = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        ~Guard() {
            // Освобождаем в обратном порядке захвата
            for (auto it = locks_.rbegin(); it != locks_.rend(); ++it) {
                it->unlock();
            }
        }

    private:
        friend class KeyedMutex;
        std::vector<std::unique_lock<std::mutex>> locks_;
    };

    /**
     * @brief Захватить мьютекс одного ключа
     */
    Guard lock(const std::string& key) {
        return lockAll({key});
    }

    /**
     * @brief Захватить мьютексы нескольких ключей
     *
     * Ключи сортируются и дедуплицируются, поэтому два потока с
     * пересекающимися наборами не могут взаимно заблокироваться.
     */
    Guard lockAll(std::vector<std::string> keys) {
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

        Guard guard;
        guard.locks_.reserve(keys.size());
        for (const auto& key : keys) {
            guard.locks_.emplace_back(*mutexFor(key));
        }
        return guard;
    }

    /**
     * @brief Количество ключей, для которых создан мьютекс
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(registryMutex_);
        return mutexes_.size();
    }

private:
    std::shared_ptr<std::mutex> mutexFor(const std::string& key) {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto& slot = mutexes_[key];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    mutable std::mutex registryMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};
