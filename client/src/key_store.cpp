#include "miniadb/client/key_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace miniadb::client
{

    KeyStore::KeyStore(std::vector<std::shared_ptr<const crypto::Signer>> signers)
    {
        for (auto &signer : signers)
        {
            add(std::move(signer));
        }
    }

    void KeyStore::add(std::shared_ptr<const crypto::Signer> signer)
    {
        if (!signer)
        {
            throw std::invalid_argument("KeyStore does not accept null signers");
        }
        if (std::find(signers_.begin(), signers_.end(), signer) == signers_.end())
        {
            signers_.push_back(std::move(signer));
        }
    }

    const crypto::Signer &KeyStore::at(std::size_t index) const
    {
        if (index >= signers_.size())
        {
            throw std::out_of_range("KeyStore index " + std::to_string(index) + " out of range");
        }
        return *signers_[index];
    }

} // namespace miniadb::client
