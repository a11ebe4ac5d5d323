/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CHashing.h>

#include <boost/config.hpp>

#include <cstring>

namespace tsa {
namespace core {

std::uint64_t CHashing::murmurHash64(const void* key, int length, std::uint64_t seed) {
    constexpr std::uint64_t m = 0xc6a4a7935bd1e995ULL;
    constexpr int r = 47;

    std::uint64_t h = seed ^ (length * m);

    // Note, remainder = length % 8
    const int remainder = length & 0x7;
    const auto* data = static_cast<const unsigned char*>(key);
    // Note, shift = (length - remainder) / 8
    const unsigned char* end = data + (length - remainder);

    while (data != end) {
        // Copy rather than dereference so unaligned input is safe.
        std::uint64_t k;
        std::memcpy(&k, data, sizeof(k));

        k *= m;
        k ^= k >> r;
        k *= m;

        h ^= k;
        h *= m;

        data += sizeof(k);
    }

    switch (remainder) {
    case 7:
        h ^= std::uint64_t(end[6]) << 48;
        BOOST_FALLTHROUGH;
    case 6:
        h ^= std::uint64_t(end[5]) << 40;
        BOOST_FALLTHROUGH;
    case 5:
        h ^= std::uint64_t(end[4]) << 32;
        BOOST_FALLTHROUGH;
    case 4:
        h ^= std::uint64_t(end[3]) << 24;
        BOOST_FALLTHROUGH;
    case 3:
        h ^= std::uint64_t(end[2]) << 16;
        BOOST_FALLTHROUGH;
    case 2:
        h ^= std::uint64_t(end[1]) << 8;
        BOOST_FALLTHROUGH;
    case 1:
        h ^= std::uint64_t(end[0]);
        h *= m;
        BOOST_FALLTHROUGH;
    default:
        break;
    }

    h ^= h >> r;
    h *= m;
    h ^= h >> r;

    return h;
}

std::string CHashing::toHex(std::uint64_t hash) {
    static const char DIGITS[] = "0123456789abcdef";
    std::string result(16, '0');
    for (int i = 15; i >= 0; --i, hash >>= 4) {
        result[i] = DIGITS[hash & 0xf];
    }
    return result;
}

CMurmurHash64Builder::CMurmurHash64Builder(std::uint64_t seed) : m_Hash{seed} {
}

CMurmurHash64Builder& CMurmurHash64Builder::add(std::int64_t value) {
    m_Hash = CHashing::murmurHash64(&value, sizeof(value), m_Hash);
    return *this;
}

CMurmurHash64Builder& CMurmurHash64Builder::add(double value) {
    // Treat -0.0 and 0.0 as the same value.
    if (value == 0.0) {
        value = 0.0;
    }
    m_Hash = CHashing::murmurHash64(&value, sizeof(value), m_Hash);
    return *this;
}

CMurmurHash64Builder& CMurmurHash64Builder::add(const std::string& value) {
    // Hash the length too so ("ab", "c") and ("a", "bc") differ.
    this->add(static_cast<std::int64_t>(value.size()));
    m_Hash = CHashing::murmurHash64(value.data(), static_cast<int>(value.size()), m_Hash);
    return *this;
}

std::uint64_t CMurmurHash64Builder::value() const {
    return m_Hash;
}
}
}
