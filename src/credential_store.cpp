/**
 * @file credential_store.cpp
 * @brief Durable account credentials implementation for chatrelay
 */

#include "chatrelay/credential_store.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace chatrelay {

static std::string nested_string(const json& record, const char* object_key, const char* key) {
    if (!record.contains(object_key) || !record[object_key].is_object()) {
        return "";
    }
    const json& inner = record[object_key];
    if (!inner.contains(key) || !inner[key].is_string()) {
        return "";
    }
    return inner[key].get<std::string>();
}

static std::string record_refresh_token(const json& record) {
    if (record.contains("refresh_token") && record["refresh_token"].is_string()) {
        std::string token = record["refresh_token"].get<std::string>();
        if (!token.empty()) return token;
    }

    std::string token = nested_string(record, "cookie_dict", REFRESH_COOKIE_NAME);
    if (!token.empty()) return token;

    return nested_string(record, "key_cookies", REFRESH_COOKIE_NAME);
}

CredentialStore::CredentialStore(std::string path) : path_(std::move(path)) {}

std::vector<CredentialRecord> CredentialStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw CredentialsNotFoundError(path_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json data = json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded()) {
        throw ConfigurationError("Credentials file is not valid JSON: " + path_, "accounts");
    }
    if (data.is_object()) {
        data = json::array({data});
    }
    if (!data.is_array()) {
        throw ConfigurationError("Credentials file must hold a list of accounts: " + path_, "accounts");
    }

    document_ = std::move(data);

    std::vector<CredentialRecord> records;
    for (std::size_t i = 0; i < document_.size(); i++) {
        const json& item = document_[i];
        if (!item.is_object()) {
            CHATRELAY_LOG_WARN("Skipping non-object account record #{}", i);
            continue;
        }

        std::string identity = item.contains("email") && item["email"].is_string()
            ? item["email"].get<std::string>()
            : "?";

        std::string refresh_token = record_refresh_token(item);
        if (refresh_token.empty()) {
            CHATRELAY_LOG_WARN("Skipping account without refreshToken: {}", identity);
            continue;
        }

        records.push_back({identity, refresh_token, i});
    }

    return records;
}

void CredentialStore::rotate(std::size_t position, const std::string& refresh_token) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (position >= document_.size() || !document_[position].is_object()) {
        throw StorageError("No credentials record at position " + std::to_string(position), path_);
    }

    document_[position]["refresh_token"] = refresh_token;
    save_locked();
}

void CredentialStore::save_locked() {
    const std::string tmp_path = path_ + ".tmp";

    {
        std::ofstream tmp_file(tmp_path, std::ios::trunc);
        if (!tmp_file.is_open()) {
            throw StorageError("Failed to open " + tmp_path + " for writing", path_);
        }
        tmp_file << document_.dump(2, ' ', false, json::error_handler_t::replace);
        tmp_file.flush();
        if (!tmp_file.good()) {
            tmp_file.close();
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            throw StorageError("Failed to write " + tmp_path, path_);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw StorageError("Failed to replace " + path_ + ": " + ec.message(), path_);
    }
}

} // namespace chatrelay
