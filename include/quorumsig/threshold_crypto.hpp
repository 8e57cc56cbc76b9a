#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quorumsig
{

    /** Partial signature contributed by one signer, as accepted from its response */
    struct PartialSignatureShare
    {
        std::string url;
        std::uint32_t index{0}; // position in the key's share set, 1-based
        std::string signature;  // base64, scheme specific
    };

    /** The distributed key active for this process */
    struct KeyEpoch
    {
        std::string public_key;
        std::uint32_t version{0};
        std::string polynomial;
    };

    /**
     * Per-request accumulator of partial signatures. Implementations verify
     * each share on addition and combine once at least threshold() shares
     * have been accepted.
     */
    class ThresholdCrypto
    {
    public:
        virtual ~ThresholdCrypto() = default;

        /**
         * Verify and accumulate a share.
         * @return true when the share was accepted; invalid or duplicate shares are dropped
         */
        virtual bool add_share(const PartialSignatureShare &share) = 0;

        virtual bool has_quorum() const = 0;

        virtual std::size_t accepted_count() const = 0;

        virtual std::size_t threshold() const = 0;

        /**
         * Combine the accepted shares over the request's blinded message.
         * Failure is reported as ErrorCode::CombinationUnavailable. A successful
         * result is cached and returned again on later calls.
         */
        virtual Result<std::string> combine() = 0;
    };

    /** Creates one ThresholdCrypto per request, bound to the request's blinded message */
    class ThresholdCryptoFactory
    {
    public:
        virtual ~ThresholdCryptoFactory() = default;

        virtual Result<std::unique_ptr<ThresholdCrypto>> create(const std::string &blinded_message) const = 0;
    };

    /**
     * Public key material of a ristretto255 threshold key: the group public key
     * and the commitments C_j = a_j*G to the coefficients of the sharing polynomial.
     */
    class RistrettoKeyMaterial
    {
    public:
        crypto::Point public_key{};
        std::vector<crypto::Point> commitments;

        /** Decode and cross-check the epoch against the expected threshold */
        static Result<RistrettoKeyMaterial> load(const KeyEpoch &epoch, std::size_t threshold);

        /** P_i = sum_j i^j * C_j */
        Result<crypto::Point> public_share(std::uint32_t index) const;

        static std::string encode_polynomial(const std::vector<crypto::Point> &commitments);
    };

    /**
     * Partial signature wire format: sigma_i || c || s, where (c, s) proves
     * log_G(P_i) == log_B(sigma_i).
     */
    struct RistrettoPartialSignature
    {
        crypto::Point sigma{};
        crypto::Scalar challenge{};
        crypto::Scalar response{};

        static constexpr std::size_t ENCODED_BYTES = 96;

        static Result<RistrettoPartialSignature> decode(const std::string &b64);
        std::string encode() const;

        /** Fiat-Shamir challenge shared by signer-side proving and verification */
        static crypto::Scalar challenge_for(const crypto::Point &public_share,
                                            const crypto::Point &blinded,
                                            const crypto::Point &sigma,
                                            const crypto::Point &commit_g,
                                            const crypto::Point &commit_b);

        bool verify(const crypto::Point &public_share, const crypto::Point &blinded) const;
    };

    class RistrettoThresholdCrypto : public ThresholdCrypto
    {
    public:
        RistrettoThresholdCrypto(std::shared_ptr<const RistrettoKeyMaterial> keys,
                                 std::size_t threshold,
                                 crypto::Point blinded);

        bool add_share(const PartialSignatureShare &share) override;
        bool has_quorum() const override { return accepted_.size() >= threshold_; }
        std::size_t accepted_count() const override { return accepted_.size(); }
        std::size_t threshold() const override { return threshold_; }
        Result<std::string> combine() override;

    private:
        std::shared_ptr<const RistrettoKeyMaterial> keys_;
        std::size_t threshold_;
        crypto::Point blinded_;
        std::map<std::uint32_t, crypto::Point> accepted_;
        std::optional<std::string> combined_;
    };

    class RistrettoThresholdCryptoFactory : public ThresholdCryptoFactory
    {
    public:
        RistrettoThresholdCryptoFactory(RistrettoKeyMaterial keys, std::size_t threshold);

        Result<std::unique_ptr<ThresholdCrypto>> create(const std::string &blinded_message) const override;

    private:
        std::shared_ptr<const RistrettoKeyMaterial> keys_;
        std::size_t threshold_;
    };

    /** Lagrange coefficient at zero for index among indices (all distinct, non-zero) */
    Result<crypto::Scalar> lagrange_at_zero(std::uint32_t index, const std::vector<std::uint32_t> &indices);

} // namespace quorumsig
