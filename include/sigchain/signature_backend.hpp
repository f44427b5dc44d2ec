#pragma once

#include "trust_store.hpp"
#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace sigchain
{

    /**
     * The cryptographic primitive the verifier delegates to. Implementations
     * keep all key state inside the TrustStore they are handed.
     */
    class SignatureBackend
    {
    public:
        virtual ~SignatureBackend() = default;

        /** Import one exported key; KeyImportError if it does not decode */
        virtual Result<void> import_key(TrustStore &store, std::string_view key_material) = 0;

        /**
         * Verify `signature` over `payload` using only keys in `store` and
         * return the raw status stream. A failed verification is not an
         * error; only failing to run the check is.
         */
        virtual Result<std::string> verify(const TrustStore &store,
                                           std::string_view payload,
                                           std::string_view signature) = 0;
    };

    namespace gpg
    {

        /** SignatureBackend that shells out to gpg (or a compatible program) */
        class GpgBackend : public SignatureBackend
        {
        public:
            explicit GpgBackend(std::string program = "gpg");

            Result<void> import_key(TrustStore &store, std::string_view key_material) override;

            Result<std::string> verify(const TrustStore &store,
                                       std::string_view payload,
                                       std::string_view signature) override;

            const std::string &program() const { return program_; }

        private:
            std::vector<std::string> base_args(const TrustStore &store) const;

            std::string program_;
        };

    } // namespace gpg

} // namespace sigchain
