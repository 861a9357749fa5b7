#include "secret_store.h"
#include "errors.h"
#include "file_descriptor.h"
#include "logger.h"

#include <openssl/crypto.h>

#include <utility>

namespace {
constexpr unsigned kDirMode  = 0700;
constexpr unsigned kFileMode = 0600;
constexpr const char* kSuffix = ".key";
} // namespace

FileSecretStore::FileSecretStore(std::string dir, Logger& log)
    : dir_(std::move(dir)), log_(log)
{
    if (dir_.empty()) {
        throw InvalidParameter("FileSecretStore: directory must not be empty");
    }
}

std::string FileSecretStore::path_for(const std::string& principal) const {
    if (principal.empty()) {
        throw InvalidParameter("FileSecretStore: empty principal");
    }
    return dir_ + "/" + fsutil::encode_name(principal) + kSuffix;
}

Secret FileSecretStore::load(const std::string& principal) {
    if (principal.empty()) {
        throw SecretUnavailable("no secret for empty principal");
    }
    std::string raw;
    try {
        if (!fsutil::read_file(path_for(principal), raw)) {
            throw SecretUnavailable("no secret configured for '" + principal + "'");
        }
    } catch (const PersistenceFailure& e) {
        log_.error_fmt("secret for '", principal, "' unreadable: ", e.what());
        throw SecretUnavailable("secret for '" + principal + "' unreadable");
    }

    Secret secret = Secret::from_string(raw);
    OPENSSL_cleanse(&raw[0], raw.size());
    if (secret.empty()) {
        throw SecretUnavailable("empty secret stored for '" + principal + "'");
    }
    return secret;
}

void FileSecretStore::save(const std::string& principal, const Secret& secret) {
    if (secret.empty()) {
        throw InvalidParameter("FileSecretStore: refusing to store an empty secret");
    }
    const std::string path = path_for(principal);
    fsutil::ensure_dir(dir_, kDirMode);

    std::string raw(reinterpret_cast<const char*>(secret.data()), secret.size());
    try {
        fsutil::write_file_atomic(path, raw, kFileMode);
    } catch (const PersistenceFailure&) {
        OPENSSL_cleanse(&raw[0], raw.size());
        throw;
    }
    OPENSSL_cleanse(&raw[0], raw.size());
    log_.info_fmt("stored secret for '", principal, "'");
}

bool FileSecretStore::exists(const std::string& principal) {
    if (principal.empty()) return false;
    std::string raw;
    try {
        const bool found = fsutil::read_file(path_for(principal), raw);
        if (!raw.empty()) OPENSSL_cleanse(&raw[0], raw.size());
        return found && !raw.empty();
    } catch (const PersistenceFailure& e) {
        log_.error_fmt("secret for '", principal, "' unreadable: ", e.what());
        throw SecretUnavailable("secret for '" + principal + "' unreadable");
    }
}

void FileSecretStore::remove(const std::string& principal) {
    if (fsutil::remove_file(path_for(principal))) {
        log_.info_fmt("removed secret for '", principal, "'");
    }
}
