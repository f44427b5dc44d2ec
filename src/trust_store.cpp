#include "sigchain/trust_store.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

#include <spdlog/spdlog.h>

namespace sigchain
{

    Result<TrustStore> TrustStore::create(const std::filesystem::path &scratch_root)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(scratch_root, ec))
        {
            return std::unexpected(SigchainError::resource(std::format(
                "scratch directory {} does not exist", scratch_root.string())));
        }

        std::string pattern = (scratch_root / "sigchain-keyring-XXXXXX").string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');

        // mkdtemp creates the directory with mode 0700
        if (::mkdtemp(buf.data()) == nullptr)
        {
            return std::unexpected(SigchainError::resource(std::format(
                "cannot create temporary keyring under {}: {}", scratch_root.string(), std::strerror(errno))));
        }
        return TrustStore(std::filesystem::path(buf.data()));
    }

    TrustStore::TrustStore(std::filesystem::path home) : home_(std::move(home))
    {
        spdlog::debug("created temporary keyring {}", home_.string());
    }

    TrustStore::TrustStore(TrustStore &&other) noexcept
        : home_(std::exchange(other.home_, {})), imported_(std::exchange(other.imported_, 0))
    {
    }

    TrustStore &TrustStore::operator=(TrustStore &&other) noexcept
    {
        if (this != &other)
        {
            release();
            home_ = std::exchange(other.home_, {});
            imported_ = std::exchange(other.imported_, 0);
        }
        return *this;
    }

    TrustStore::~TrustStore()
    {
        release();
    }

    std::filesystem::path TrustStore::scratch_file(const std::string &name) const
    {
        return home_ / name;
    }

    void TrustStore::release()
    {
        if (home_.empty())
            return;

        std::error_code ec;
        std::filesystem::remove_all(home_, ec);
        if (ec)
            spdlog::warn("failed to remove temporary keyring {}: {}", home_.string(), ec.message());
        else
            spdlog::debug("removed temporary keyring {}", home_.string());
        home_.clear();
        imported_ = 0;
    }

} // namespace sigchain
