#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "miniadb/crypto.hpp"

namespace miniadb::client
{

    // Ordered, in-memory set of signers tried during AUTH. The first signer's
    // public key is the one offered when no signature is accepted.
    class KeyStore
    {
    public:
        KeyStore() = default;
        explicit KeyStore(std::vector<std::shared_ptr<const crypto::Signer>> signers);

        void add(std::shared_ptr<const crypto::Signer> signer);

        bool empty() const noexcept { return signers_.empty(); }
        std::size_t size() const noexcept { return signers_.size(); }
        const crypto::Signer &at(std::size_t index) const;

    private:
        std::vector<std::shared_ptr<const crypto::Signer>> signers_;
    };

} // namespace miniadb::client
