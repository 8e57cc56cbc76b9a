#include "quorumsig/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace quorumsig::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr, // ignore characters
                &decoded_len,
                nullptr, // end pointer
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(QuorumSigError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    // ============================================================================
    // Ristretto Implementation
    // ============================================================================

    bool Ristretto::is_valid_point(const Point &p)
    {
        return crypto_core_ristretto255_is_valid_point(p.data()) == 1;
    }

    Result<Point> Ristretto::point_from_bytes(const Bytes &bytes)
    {
        if (bytes.size() != crypto_core_ristretto255_BYTES)
        {
            return std::unexpected(QuorumSigError::crypto(
                std::format("Invalid point length (expected {} bytes, got {})",
                            crypto_core_ristretto255_BYTES, bytes.size())));
        }
        Point p{};
        std::copy(bytes.begin(), bytes.end(), p.begin());
        if (!is_valid_point(p))
            return std::unexpected(QuorumSigError::crypto("Not a valid ristretto255 point"));
        return p;
    }

    Result<Point> Ristretto::point_from_base64(const std::string &b64)
    {
        auto bytes = Base64::decode(b64);
        if (!bytes)
            return std::unexpected(bytes.error());
        return point_from_bytes(*bytes);
    }

    std::string Ristretto::point_to_base64(const Point &p)
    {
        return Base64::encode(Bytes(p.begin(), p.end()));
    }

    Point Ristretto::hash_to_point(const Bytes &data)
    {
        std::array<uint8_t, crypto_hash_sha512_BYTES> digest{};
        crypto_hash_sha512(digest.data(), data.data(), data.size());
        Point p{};
        crypto_core_ristretto255_from_hash(p.data(), digest.data());
        return p;
    }

    Result<Point> Ristretto::base_mul(const Scalar &n)
    {
        Point q{};
        if (crypto_scalarmult_ristretto255_base(q.data(), n.data()) != 0)
            return std::unexpected(QuorumSigError::crypto("Base multiplication produced the identity"));
        return q;
    }

    Result<Point> Ristretto::mul(const Scalar &n, const Point &p)
    {
        Point q{};
        if (crypto_scalarmult_ristretto255(q.data(), n.data(), p.data()) != 0)
            return std::unexpected(QuorumSigError::crypto("Scalar multiplication produced the identity"));
        return q;
    }

    Result<Point> Ristretto::add(const Point &p, const Point &q)
    {
        Point r{};
        if (crypto_core_ristretto255_add(r.data(), p.data(), q.data()) != 0)
            return std::unexpected(QuorumSigError::crypto("Point addition on invalid input"));
        return r;
    }

    Scalar Ristretto::scalar_from_uint(uint64_t value)
    {
        Scalar s{};
        for (size_t i = 0; i < sizeof(value); ++i)
        {
            s[i] = static_cast<uint8_t>(value >> (8 * i));
        }
        return s;
    }

    Scalar Ristretto::scalar_random()
    {
        Scalar s{};
        crypto_core_ristretto255_scalar_random(s.data());
        return s;
    }

    Scalar Ristretto::scalar_from_hash(const Bytes &data)
    {
        std::array<uint8_t, crypto_hash_sha512_BYTES> digest{};
        crypto_hash_sha512(digest.data(), data.data(), data.size());
        Scalar s{};
        crypto_core_ristretto255_scalar_reduce(s.data(), digest.data());
        return s;
    }

    Scalar Ristretto::scalar_add(const Scalar &x, const Scalar &y)
    {
        Scalar z{};
        crypto_core_ristretto255_scalar_add(z.data(), x.data(), y.data());
        return z;
    }

    Scalar Ristretto::scalar_sub(const Scalar &x, const Scalar &y)
    {
        Scalar z{};
        crypto_core_ristretto255_scalar_sub(z.data(), x.data(), y.data());
        return z;
    }

    Scalar Ristretto::scalar_mul(const Scalar &x, const Scalar &y)
    {
        Scalar z{};
        crypto_core_ristretto255_scalar_mul(z.data(), x.data(), y.data());
        return z;
    }

    Result<Scalar> Ristretto::scalar_invert(const Scalar &s)
    {
        Scalar recip{};
        if (crypto_core_ristretto255_scalar_invert(recip.data(), s.data()) != 0)
            return std::unexpected(QuorumSigError::crypto("Cannot invert zero scalar"));
        return recip;
    }

} // namespace quorumsig::crypto
