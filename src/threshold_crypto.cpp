#include "quorumsig/threshold_crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace quorumsig
{
    using crypto::Bytes;
    using crypto::Point;
    using crypto::Ristretto;
    using crypto::Scalar;

    namespace
    {
        constexpr std::string_view DLEQ_DOMAIN = "quorumsig-dleq-v1";

        void append(Bytes &out, const Point &p)
        {
            out.insert(out.end(), p.begin(), p.end());
        }
    } // namespace

    // ============================================================================
    // RistrettoKeyMaterial
    // ============================================================================

    Result<RistrettoKeyMaterial> RistrettoKeyMaterial::load(const KeyEpoch &epoch, std::size_t threshold)
    {
        if (threshold == 0)
            return std::unexpected(QuorumSigError::config("Threshold must be at least 1"));

        auto pub = Ristretto::point_from_base64(epoch.public_key);
        if (!pub)
            return std::unexpected(QuorumSigError::config("Invalid public key: " + std::string(pub.error().what())));

        auto poly = crypto::Base64::decode(epoch.polynomial);
        if (!poly)
            return std::unexpected(QuorumSigError::config("Invalid polynomial: " + std::string(poly.error().what())));
        if (poly->size() != threshold * Ristretto::POINT_BYTES)
        {
            return std::unexpected(QuorumSigError::config(std::format(
                "Polynomial must hold {} commitments for threshold {}, got {} bytes",
                threshold, threshold, poly->size())));
        }

        RistrettoKeyMaterial keys;
        keys.public_key = *pub;
        keys.commitments.reserve(threshold);
        for (std::size_t i = 0; i < threshold; ++i)
        {
            auto begin = poly->begin() + static_cast<std::ptrdiff_t>(i * Ristretto::POINT_BYTES);
            auto point = Ristretto::point_from_bytes(Bytes(begin, begin + Ristretto::POINT_BYTES));
            if (!point)
                return std::unexpected(QuorumSigError::config(std::format("Invalid polynomial commitment {}", i)));
            keys.commitments.push_back(*point);
        }

        if (keys.commitments.front() != keys.public_key)
            return std::unexpected(QuorumSigError::config("Public key does not match polynomial constant term"));

        return keys;
    }

    Result<Point> RistrettoKeyMaterial::public_share(std::uint32_t index) const
    {
        if (index == 0)
            return std::unexpected(QuorumSigError::crypto("Signer index must be non-zero"));

        const Scalar x = Ristretto::scalar_from_uint(index);
        Scalar power = Ristretto::scalar_from_uint(1);
        std::optional<Point> acc;
        for (const auto &commitment : commitments)
        {
            auto term = Ristretto::mul(power, commitment);
            if (!term)
                return std::unexpected(term.error());
            if (!acc)
            {
                acc = *term;
            }
            else
            {
                auto sum = Ristretto::add(*acc, *term);
                if (!sum)
                    return std::unexpected(sum.error());
                acc = *sum;
            }
            power = Ristretto::scalar_mul(power, x);
        }
        if (!acc || !Ristretto::is_valid_point(*acc))
            return std::unexpected(QuorumSigError::crypto("Degenerate public share"));
        return *acc;
    }

    std::string RistrettoKeyMaterial::encode_polynomial(const std::vector<Point> &commitments)
    {
        Bytes out;
        out.reserve(commitments.size() * Ristretto::POINT_BYTES);
        for (const auto &c : commitments)
            append(out, c);
        return crypto::Base64::encode(out);
    }

    // ============================================================================
    // RistrettoPartialSignature
    // ============================================================================

    Result<RistrettoPartialSignature> RistrettoPartialSignature::decode(const std::string &b64)
    {
        auto bytes = crypto::Base64::decode(b64);
        if (!bytes)
            return std::unexpected(bytes.error());
        if (bytes->size() != ENCODED_BYTES)
        {
            return std::unexpected(QuorumSigError::crypto(std::format(
                "Invalid partial signature length (expected {} bytes, got {})", ENCODED_BYTES, bytes->size())));
        }

        RistrettoPartialSignature sig;
        std::copy_n(bytes->begin(), 32, sig.sigma.begin());
        std::copy_n(bytes->begin() + 32, 32, sig.challenge.begin());
        std::copy_n(bytes->begin() + 64, 32, sig.response.begin());
        if (!Ristretto::is_valid_point(sig.sigma))
            return std::unexpected(QuorumSigError::crypto("Partial signature is not a valid point"));
        return sig;
    }

    std::string RistrettoPartialSignature::encode() const
    {
        Bytes out;
        out.reserve(ENCODED_BYTES);
        out.insert(out.end(), sigma.begin(), sigma.end());
        out.insert(out.end(), challenge.begin(), challenge.end());
        out.insert(out.end(), response.begin(), response.end());
        return crypto::Base64::encode(out);
    }

    Scalar RistrettoPartialSignature::challenge_for(const Point &public_share,
                                                    const Point &blinded,
                                                    const Point &sigma,
                                                    const Point &commit_g,
                                                    const Point &commit_b)
    {
        Bytes transcript(DLEQ_DOMAIN.begin(), DLEQ_DOMAIN.end());
        append(transcript, public_share);
        append(transcript, blinded);
        append(transcript, sigma);
        append(transcript, commit_g);
        append(transcript, commit_b);
        return Ristretto::scalar_from_hash(transcript);
    }

    bool RistrettoPartialSignature::verify(const Point &public_share, const Point &blinded) const
    {
        // A1 = s*G + c*P_i, A2 = s*B + c*sigma_i
        auto sg = Ristretto::base_mul(response);
        auto cp = Ristretto::mul(challenge, public_share);
        auto sb = Ristretto::mul(response, blinded);
        auto cs = Ristretto::mul(challenge, sigma);
        if (!sg || !cp || !sb || !cs)
            return false;

        auto a1 = Ristretto::add(*sg, *cp);
        auto a2 = Ristretto::add(*sb, *cs);
        if (!a1 || !a2)
            return false;

        return challenge_for(public_share, blinded, sigma, *a1, *a2) == challenge;
    }

    // ============================================================================
    // Lagrange interpolation
    // ============================================================================

    Result<Scalar> lagrange_at_zero(std::uint32_t index, const std::vector<std::uint32_t> &indices)
    {
        const Scalar xi = Ristretto::scalar_from_uint(index);
        Scalar num = Ristretto::scalar_from_uint(1);
        Scalar den = Ristretto::scalar_from_uint(1);
        for (auto j : indices)
        {
            if (j == index)
                continue;
            const Scalar xj = Ristretto::scalar_from_uint(j);
            num = Ristretto::scalar_mul(num, xj);
            den = Ristretto::scalar_mul(den, Ristretto::scalar_sub(xj, xi));
        }
        auto inv = Ristretto::scalar_invert(den);
        if (!inv)
            return std::unexpected(inv.error());
        return Ristretto::scalar_mul(num, *inv);
    }

    // ============================================================================
    // RistrettoThresholdCrypto
    // ============================================================================

    RistrettoThresholdCrypto::RistrettoThresholdCrypto(std::shared_ptr<const RistrettoKeyMaterial> keys,
                                                       std::size_t threshold,
                                                       Point blinded)
        : keys_(std::move(keys)), threshold_(threshold), blinded_(blinded)
    {
    }

    bool RistrettoThresholdCrypto::add_share(const PartialSignatureShare &share)
    {
        if (accepted_.contains(share.index))
        {
            spdlog::warn("Duplicate share for signer index {} from {}", share.index, share.url);
            return false;
        }

        auto sig = RistrettoPartialSignature::decode(share.signature);
        if (!sig)
        {
            spdlog::warn("Undecodable partial signature from {}: {}", share.url, sig.error().what());
            return false;
        }

        auto public_share = keys_->public_share(share.index);
        if (!public_share)
        {
            spdlog::warn("No public share for signer {}: {}", share.url, public_share.error().what());
            return false;
        }

        if (!sig->verify(*public_share, blinded_))
        {
            spdlog::warn("Invalid partial signature from {}", share.url);
            return false;
        }

        accepted_.emplace(share.index, sig->sigma);
        return true;
    }

    Result<std::string> RistrettoThresholdCrypto::combine()
    {
        if (combined_)
            return *combined_;

        if (accepted_.size() < threshold_)
        {
            return std::unexpected(QuorumSigError::combination_unavailable(std::format(
                "Not enough valid partial signatures: {}/{}", accepted_.size(), threshold_)));
        }

        std::vector<std::uint32_t> indices;
        indices.reserve(threshold_);
        for (const auto &[index, _] : accepted_)
        {
            if (indices.size() == threshold_)
                break;
            indices.push_back(index);
        }

        std::optional<Point> acc;
        for (auto index : indices)
        {
            auto lambda = lagrange_at_zero(index, indices);
            if (!lambda)
                return std::unexpected(QuorumSigError::combination_unavailable(lambda.error().what()));
            auto term = Ristretto::mul(*lambda, accepted_.at(index));
            if (!term)
                return std::unexpected(QuorumSigError::combination_unavailable(term.error().what()));
            if (!acc)
            {
                acc = *term;
                continue;
            }
            auto sum = Ristretto::add(*acc, *term);
            if (!sum)
                return std::unexpected(QuorumSigError::combination_unavailable(sum.error().what()));
            acc = *sum;
        }

        if (!acc || !Ristretto::is_valid_point(*acc))
            return std::unexpected(QuorumSigError::combination_unavailable("Combined signature is degenerate"));

        combined_ = Ristretto::point_to_base64(*acc);
        return *combined_;
    }

    // ============================================================================
    // RistrettoThresholdCryptoFactory
    // ============================================================================

    RistrettoThresholdCryptoFactory::RistrettoThresholdCryptoFactory(RistrettoKeyMaterial keys, std::size_t threshold)
        : keys_(std::make_shared<const RistrettoKeyMaterial>(std::move(keys))), threshold_(threshold)
    {
    }

    Result<std::unique_ptr<ThresholdCrypto>> RistrettoThresholdCryptoFactory::create(const std::string &blinded_message) const
    {
        auto blinded = Ristretto::point_from_base64(blinded_message);
        if (!blinded)
            return std::unexpected(QuorumSigError::invalid_input("Blinded message is not a valid group element"));
        return std::make_unique<RistrettoThresholdCrypto>(keys_, threshold_, *blinded);
    }

} // namespace quorumsig
