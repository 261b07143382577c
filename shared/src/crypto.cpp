#include "miniadb/crypto.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace miniadb::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    SodiumSigner::SodiumSigner(std::string comment) : comment_(std::move(comment)) {}

    SodiumSigner::SodiumSigner(const SodiumSigner &other) = default;

    SodiumSigner &SodiumSigner::operator=(const SodiumSigner &other) = default;

    SodiumSigner::~SodiumSigner()
    {
        sodium_memzero(secret_key_.data(), secret_key_.size());
    }

    SodiumSigner SodiumSigner::generate(std::string comment)
    {
        ensure_initialized_once();
        SodiumSigner signer(std::move(comment));
        if (crypto_sign_keypair(signer.public_key_.data(), signer.secret_key_.data()) != 0)
        {
            throw std::runtime_error("crypto_sign_keypair failed");
        }
        return signer;
    }

    SodiumSigner SodiumSigner::from_seed(std::span<const std::uint8_t> seed, std::string comment)
    {
        ensure_initialized_once();
        if (seed.size() != crypto_sign_SEEDBYTES)
        {
            throw std::invalid_argument("Signer seed must be " + std::to_string(crypto_sign_SEEDBYTES) + " bytes");
        }
        SodiumSigner signer(std::move(comment));
        if (crypto_sign_seed_keypair(signer.public_key_.data(), signer.secret_key_.data(), seed.data()) != 0)
        {
            throw std::runtime_error("crypto_sign_seed_keypair failed");
        }
        return signer;
    }

    Bytes SodiumSigner::sign(std::span<const std::uint8_t> challenge) const
    {
        ensure_initialized_once();
        Bytes signature(crypto_sign_BYTES);
        unsigned long long signature_length = 0;
        if (crypto_sign_detached(signature.data(), &signature_length, challenge.data(), challenge.size(),
                                 secret_key_.data()) != 0)
        {
            throw std::runtime_error("crypto_sign_detached failed");
        }
        signature.resize(static_cast<std::size_t>(signature_length));
        return signature;
    }

    Bytes SodiumSigner::public_key() const
    {
        auto text = encode_base64(public_key_);
        if (!comment_.empty())
        {
            text.push_back(' ');
            text.append(comment_);
        }
        return Bytes(text.begin(), text.end());
    }

    bool verify_signature(std::span<const std::uint8_t> challenge, std::span<const std::uint8_t> signature,
                          std::span<const std::uint8_t> raw_public_key)
    {
        ensure_initialized_once();
        if (signature.size() != crypto_sign_BYTES || raw_public_key.size() != crypto_sign_PUBLICKEYBYTES)
        {
            return false;
        }
        return crypto_sign_verify_detached(signature.data(), challenge.data(), challenge.size(),
                                           raw_public_key.data()) == 0;
    }

    std::optional<Bytes> parse_public_key(std::span<const std::uint8_t> blob)
    {
        const auto end = std::find_if(blob.begin(), blob.end(), [](std::uint8_t byte)
                                      { return byte == ' ' || byte == 0; });
        const std::string encoded(blob.begin(), end);
        auto decoded = decode_base64(encoded);
        if (!decoded || decoded->size() != crypto_sign_PUBLICKEYBYTES)
        {
            return std::nullopt;
        }
        return decoded;
    }

    std::string encode_base64(std::span<const std::uint8_t> data)
    {
        ensure_initialized_once();
        const auto encoded_length = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(encoded_length, '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
        // encoded_length counts the terminating NUL.
        encoded.resize(encoded_length - 1);
        return encoded;
    }

    std::optional<Bytes> decode_base64(std::string_view text)
    {
        ensure_initialized_once();
        Bytes decoded(text.size() / 4 * 3 + 3);
        std::size_t decoded_length = 0;
        if (sodium_base642bin(decoded.data(), decoded.size(), text.data(), text.size(), nullptr, &decoded_length,
                              nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::nullopt;
        }
        decoded.resize(decoded_length);
        return decoded;
    }

} // namespace miniadb::crypto
