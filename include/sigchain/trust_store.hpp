#pragma once

#include "types.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace sigchain
{

    /**
     * Ephemeral keyring home for exactly one verification attempt.
     *
     * Owns a private (0700) directory created with mkdtemp under the scratch
     * root. The directory and everything imported into it are removed when
     * the store is destroyed. Move-only; never shared between attempts.
     */
    class TrustStore
    {
    public:
        /** Create a fresh store below `scratch_root`; ResourceError on failure */
        static Result<TrustStore> create(const std::filesystem::path &scratch_root);

        TrustStore(TrustStore &&other) noexcept;
        TrustStore &operator=(TrustStore &&other) noexcept;
        TrustStore(const TrustStore &) = delete;
        TrustStore &operator=(const TrustStore &) = delete;
        ~TrustStore();

        const std::filesystem::path &home() const { return home_; }

        /** Path for a scratch file private to this store */
        std::filesystem::path scratch_file(const std::string &name) const;

        std::size_t imported_keys() const { return imported_; }
        void note_import() { ++imported_; }

        /** Remove the directory now; safe to call more than once */
        void release();

    private:
        explicit TrustStore(std::filesystem::path home);

        std::filesystem::path home_;
        std::size_t imported_{0};
    };

} // namespace sigchain
