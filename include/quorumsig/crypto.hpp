#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace quorumsig::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using Point = std::array<uint8_t, 32>;
    using Scalar = std::array<uint8_t, 32>;

    /**
     * Base64 encoding/decoding (standard alphabet, padded)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static Bytes generate_bytes(size_t n);
    };

    /**
     * ristretto255 prime-order group and its scalar field, backed by libsodium.
     * Point operations that would produce the identity element are reported as
     * errors, matching libsodium's own contract.
     */
    class Ristretto
    {
    public:
        static constexpr size_t POINT_BYTES = 32;
        static constexpr size_t SCALAR_BYTES = 32;

        static bool is_valid_point(const Point &p);

        /** Decode a canonical encoded point, rejecting anything else */
        static Result<Point> point_from_bytes(const Bytes &bytes);

        static Result<Point> point_from_base64(const std::string &b64);

        static std::string point_to_base64(const Point &p);

        /** Hash arbitrary bytes onto the group (SHA-512 then Elligator) */
        static Point hash_to_point(const Bytes &data);

        static Result<Point> base_mul(const Scalar &n);

        static Result<Point> mul(const Scalar &n, const Point &p);

        static Result<Point> add(const Point &p, const Point &q);

        static Scalar scalar_from_uint(uint64_t value);

        static Scalar scalar_random();

        /** Reduce a SHA-512 digest of data modulo the group order */
        static Scalar scalar_from_hash(const Bytes &data);

        static Scalar scalar_add(const Scalar &x, const Scalar &y);

        static Scalar scalar_sub(const Scalar &x, const Scalar &y);

        static Scalar scalar_mul(const Scalar &x, const Scalar &y);

        static Result<Scalar> scalar_invert(const Scalar &s);
    };

} // namespace quorumsig::crypto
