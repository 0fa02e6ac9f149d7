#include "ark/foundation/id_generator.hpp"

#include <array>
#include <cstdio>

namespace ark::foundation {

PersistentIdGenerator::PersistentIdGenerator()
    : engine_(std::random_device{}()) {}

PersistentIdGenerator::PersistentIdGenerator(uint64_t seed)
    : engine_(seed) {}

std::string PersistentIdGenerator::next() {
    std::lock_guard lock(mutex_);
    for (;;) {
        std::array<char, 17> buf{};
        std::snprintf(buf.data(), buf.size(), "%016llx",
                      static_cast<unsigned long long>(engine_()));
        std::string id(buf.data(), 16);
        if (issued_.insert(id).second) {
            return id;
        }
    }
}

bool PersistentIdGenerator::reserve(const std::string& id) {
    std::lock_guard lock(mutex_);
    return issued_.insert(id).second;
}

bool PersistentIdGenerator::contains(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return issued_.count(id) > 0;
}

std::string generateUuid() {
    thread_local std::mt19937_64 engine(std::random_device{}());
    std::uniform_int_distribution<uint32_t> byte(0, 255);

    std::array<uint8_t, 16> bytes{};
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(byte(engine));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += kHex[bytes[i] >> 4];
        out += kHex[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace ark::foundation
