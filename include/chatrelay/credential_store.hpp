/**
 * @file credential_store.hpp
 * @brief Durable account credentials for chatrelay
 */

#ifndef CHATRELAY_CREDENTIAL_STORE_HPP
#define CHATRELAY_CREDENTIAL_STORE_HPP

#include "types.hpp"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace chatrelay {

/**
 * One usable record of the credentials file
 */
struct CredentialRecord {
    std::string identity;
    std::string refresh_token;
    /// Index of the record in the credentials document.
    std::size_t position = 0;
};

/**
 * Flat JSON file of `{email, refresh_token}` records
 *
 * The file is produced by an external signup pipeline; records keep any
 * extra fields it wrote. Rewrites are serialized and atomic.
 */
class CredentialStore {
public:
    /**
     * Create a store
     * @param path Path to the credentials file
     */
    explicit CredentialStore(std::string path);

    /**
     * Read the credentials file
     * @return Records carrying a rotating credential, in file order
     * @throws CredentialsNotFoundError if the file cannot be opened
     * @throws ConfigurationError if the file is not valid JSON
     */
    std::vector<CredentialRecord> load();

    /**
     * Replace the rotating credential of one record and rewrite the file
     * before returning
     * @param position Record position from load()
     * @param refresh_token New rotating credential
     * @throws StorageError if the file cannot be rewritten
     */
    void rotate(std::size_t position, const std::string& refresh_token);

    const std::string& path() const { return path_; }

private:
    void save_locked();

    std::string path_;
    json document_ = json::array();
    std::mutex mutex_;
};

} // namespace chatrelay

#endif // CHATRELAY_CREDENTIAL_STORE_HPP
