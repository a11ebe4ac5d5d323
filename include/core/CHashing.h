/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_tsa_core_CHashing_h
#define INCLUDED_tsa_core_CHashing_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <cstdint>
#include <string>

namespace tsa {
namespace core {

//! \brief Hashing functions.
//!
//! DESCRIPTION:\n
//! Non-cryptographic hashes used for content fingerprints. These must be
//! stable across runs and processes so that a fingerprint persisted with
//! an artifact can be compared with one computed later, i.e. they must
//! never be seeded randomly.
class CORE_EXPORT CHashing : private CNonInstantiatable {
public:
    //! Implements MurmurHash2 for 64-bit platforms (MurmurHash64A).
    //!
    //! \param[in] key The data to hash.
    //! \param[in] length The length of \p key in bytes.
    //! \param[in] seed The initial value of the hash.
    static std::uint64_t murmurHash64(const void* key, int length, std::uint64_t seed);

    //! Render \p hash as 16 lower case hex digits.
    static std::string toHex(std::uint64_t hash);
};

//! \brief Accumulates a 64 bit murmur hash over a sequence of values.
//!
//! Each value is hashed with the running hash as its seed, so the result
//! depends on the order in which values are added.
class CORE_EXPORT CMurmurHash64Builder {
public:
    explicit CMurmurHash64Builder(std::uint64_t seed = 0);

    CMurmurHash64Builder& add(std::int64_t value);
    CMurmurHash64Builder& add(double value);
    CMurmurHash64Builder& add(const std::string& value);

    std::uint64_t value() const;

private:
    std::uint64_t m_Hash;
};
}
}

#endif // INCLUDED_tsa_core_CHashing_h
