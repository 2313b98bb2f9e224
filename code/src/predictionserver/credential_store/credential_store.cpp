#include "credential_store.hpp"
#include <stdexcept>

namespace Authentication
{
    CredentialStore::CredentialStore(const std::vector<Credential> &credentials)
    {
        for (const auto &credential : credentials)
        {
            if (credential.username.empty())
            {
                throw std::invalid_argument("Credential with empty username");
            }
            if (!users_.emplace(credential.username, credential.password).second)
            {
                throw std::invalid_argument("Duplicate username: " + credential.username);
            }
        }
    }

    bool CredentialStore::verify(const std::string &username, const std::string &password) const
    {
        auto it = users_.find(username);
        if (it == users_.end())
        {
            return false;
        }
        return ct_equal(it->second, password);
    }

    bool CredentialStore::contains(const std::string &username) const
    {
        return users_.find(username) != users_.end();
    }

    // Folds every byte so the running time does not depend on the first mismatch.
    bool CredentialStore::ct_equal(const std::string &a, const std::string &b)
    {
        unsigned char diff = a.size() == b.size() ? 0 : 1;
        const std::size_t n = a.size() < b.size() ? a.size() : b.size();
        for (std::size_t i = 0; i < n; ++i)
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        return diff == 0;
    }
}
