#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ledger::utils {

/**
 * @brief Генератор идентификаторов документов
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        auto& gen = engine();
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((high >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }

    /**
     * @brief Короткий ID с префиксом: "acc-1a2b3c4d", "je-0f9e8d7c"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::uniform_int_distribution<uint32_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(8) << dist(engine());
        return ss.str();
    }

private:
    static std::mt19937_64& engine() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        return gen;
    }
};

} // namespace ledger::utils
