#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace Authentication
{
    struct Credential
    {
        std::string username;
        std::string password;
    };

    // Fixed username -> password table. Read-only after construction.
    class CredentialStore
    {
    public:
        // Throws std::invalid_argument on an empty username or a duplicate username.
        explicit CredentialStore(const std::vector<Credential> &credentials);

        bool verify(const std::string &username, const std::string &password) const;
        bool contains(const std::string &username) const;
        std::size_t size() const { return users_.size(); }

    private:
        static bool ct_equal(const std::string &a, const std::string &b);

        std::unordered_map<std::string, std::string> users_;
    };
}
