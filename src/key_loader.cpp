#include "sigchain/key_loader.hpp"

#include <spdlog/spdlog.h>

namespace sigchain
{

    KeyMaterialLoader::KeyMaterialLoader(ObjectStore &objects,
                                         SignatureBackend &backend,
                                         std::filesystem::path scratch_root)
        : objects_(objects), backend_(backend), scratch_root_(std::move(scratch_root))
    {
    }

    Result<LoadedKeyring> KeyMaterialLoader::load(const std::string &commit_id, const std::string &key_dir)
    {
        auto type = objects_.entry_type(commit_id, key_dir);
        if (!type)
            return std::unexpected(type.error());
        if (!type->has_value() || **type != EntryType::Tree)
        {
            return std::unexpected(SigchainError::no_key_directory(std::format(
                "commit {} has no directory '{}'", short_id(commit_id), key_dir)));
        }

        auto blobs = objects_.list_blobs(commit_id, key_dir);
        if (!blobs)
            return std::unexpected(blobs.error());

        auto store = TrustStore::create(scratch_root_);
        if (!store)
            return std::unexpected(store.error());

        LoadedKeyring keyring{std::move(*store), {}, {}};
        for (const auto &entry : *blobs)
        {
            auto material = objects_.blob(commit_id, entry.path);
            if (!material)
                return std::unexpected(material.error());

            auto imported = backend_.import_key(keyring.store, *material);
            if (imported)
            {
                spdlog::debug("imported key material {}", entry.path);
                keyring.imported.push_back(entry.path);
                continue;
            }

            if (imported.error().code != ErrorCode::KeyImportError)
                return std::unexpected(imported.error());

            spdlog::warn("skipping {} from {}: {}", entry.path, short_id(commit_id), imported.error().what());
            keyring.failures.push_back(KeyImportFailure{entry.path, imported.error().what()});
        }

        return keyring;
    }

} // namespace sigchain
