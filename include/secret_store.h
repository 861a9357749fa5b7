// include/secret_store.h
#pragma once
#include "secret.h"
#include <string>

class Logger;

// Credential store boundary. The verification path only calls load/exists;
// provisioning calls save.
class SecretStore {
public:
    virtual ~SecretStore() = default;

    // Throws SecretUnavailable when the principal has no readable secret.
    virtual Secret load(const std::string& principal) = 0;
    // Replaces any existing secret. Throws PersistenceFailure.
    virtual void save(const std::string& principal, const Secret& secret) = 0;
    // False only when no record exists. Throws SecretUnavailable when a
    // record exists but cannot be read.
    virtual bool exists(const std::string& principal) = 0;
    // Removing a principal without a secret is not an error. Throws PersistenceFailure.
    virtual void remove(const std::string& principal) = 0;
};

// One raw-key file per principal under dir (dir 0700, files 0600), written
// with temp + rename. Intended for a root-owned directory on Linux hosts.
class FileSecretStore : public SecretStore {
public:
    FileSecretStore(std::string dir, Logger& log);

    Secret load(const std::string& principal) override;
    void save(const std::string& principal, const Secret& secret) override;
    bool exists(const std::string& principal) override;
    void remove(const std::string& principal) override;

    const std::string& dir() const noexcept { return dir_; }

private:
    std::string dir_;
    Logger& log_;

    std::string path_for(const std::string& principal) const;
};
