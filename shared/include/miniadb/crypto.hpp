/**
 * MiniADB - Signer capability and a libsodium-backed implementation.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace miniadb::crypto
{

    using Bytes = std::vector<std::uint8_t>;

    void ensure_sodium_init();

    // Proves possession of a private key to the device during AUTH. The
    // connection treats both blobs as opaque.
    class Signer
    {
    public:
        virtual ~Signer() = default;

        virtual Bytes sign(std::span<const std::uint8_t> challenge) const = 0;

        virtual Bytes public_key() const = 0;
    };

    class SodiumSigner : public Signer
    {
    public:
        static constexpr std::size_t kPublicKeySize = 32;
        static constexpr std::size_t kSeedSize = 32;

        static SodiumSigner generate(std::string comment);
        static SodiumSigner from_seed(std::span<const std::uint8_t> seed, std::string comment);

        SodiumSigner(const SodiumSigner &other);
        SodiumSigner &operator=(const SodiumSigner &other);
        ~SodiumSigner() override;

        Bytes sign(std::span<const std::uint8_t> challenge) const override;

        // "<base64 key> <comment>", the layout adb uses in adbkey.pub.
        Bytes public_key() const override;

        std::span<const std::uint8_t> raw_public_key() const noexcept { return public_key_; }
        const std::string &comment() const noexcept { return comment_; }

    private:
        explicit SodiumSigner(std::string comment);

        std::array<std::uint8_t, kPublicKeySize> public_key_{};
        std::array<std::uint8_t, 64> secret_key_{};
        std::string comment_;
    };

    bool verify_signature(std::span<const std::uint8_t> challenge, std::span<const std::uint8_t> signature,
                          std::span<const std::uint8_t> raw_public_key);

    // Extracts the raw key from a public_key() blob; tolerates a trailing NUL.
    std::optional<Bytes> parse_public_key(std::span<const std::uint8_t> blob);

    std::string encode_base64(std::span<const std::uint8_t> data);

    std::optional<Bytes> decode_base64(std::string_view text);

} // namespace miniadb::crypto
