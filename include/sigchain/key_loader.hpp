#pragma once

#include "object_store.hpp"
#include "signature_backend.hpp"
#include "trust_store.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace sigchain
{

    struct KeyImportFailure
    {
        std::string path;
        std::string reason;
    };

    /** A trust store populated from one commit's key directory */
    struct LoadedKeyring
    {
        TrustStore store;
        std::vector<std::string> imported;
        std::vector<KeyImportFailure> failures;
    };

    /**
     * Loads the key directory snapshot of a commit into a fresh TrustStore.
     * Blobs that fail to import are skipped with a warning; the directory
     * itself being absent is a NoKeyDirectory error.
     */
    class KeyMaterialLoader
    {
    public:
        KeyMaterialLoader(ObjectStore &objects, SignatureBackend &backend, std::filesystem::path scratch_root);

        Result<LoadedKeyring> load(const std::string &commit_id, const std::string &key_dir);

    private:
        ObjectStore &objects_;
        SignatureBackend &backend_;
        std::filesystem::path scratch_root_;
    };

} // namespace sigchain
