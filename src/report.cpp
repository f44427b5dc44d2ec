#include "sigchain/report.hpp"
#include <fstream>

namespace sigchain
{

    namespace
    {
        template <typename T>
        nlohmann::json optional_json(const std::optional<T> &value)
        {
            if (!value)
                return nullptr;
            return *value;
        }
    } // namespace

    nlohmann::json ParentAttempt::to_json() const
    {
        return nlohmann::json{{"parent", parent},
                              {"verdict", verdict_to_string(verdict)},
                              {"detail", detail},
                              {"keys_imported", keys_imported},
                              {"keys_skipped", keys_skipped},
                              {"signer_key_id", optional_json(signer_key_id)},
                              {"signer_uid", optional_json(signer_uid)}};
    }

    nlohmann::json CommitVerification::to_json() const
    {
        nlohmann::json j;
        j["commit"] = commit;
        j["accepted"] = accepted;
        j["verdict"] = verdict_to_string(verdict);
        j["trusted_parent"] = optional_json(trusted_parent);
        j["attempts"] = nlohmann::json::array();
        for (const auto &attempt : attempts)
            j["attempts"].push_back(attempt.to_json());
        return j;
    }

    nlohmann::json PushReport::to_json() const
    {
        nlohmann::json j;
        j["ref"] = update.ref_name;
        j["old"] = update.old_value;
        j["new"] = update.new_value;
        j["accepted"] = accepted();
        j["range"] = range;
        j["commits"] = nlohmann::json::array();
        for (const auto &c : commits)
            j["commits"].push_back(c.to_json());
        if (failure)
        {
            j["failure"] = {{"commit", failure->commit},
                            {"code", error_code_to_string(failure->code)},
                            {"message", failure->message}};
        }
        else
        {
            j["failure"] = nullptr;
        }
        return j;
    }

    Result<void> write_report(const PushReport &report, const std::string &path)
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            return std::unexpected(SigchainError::resource("Unable to open report file: " + path));
        }
        out << report.to_json().dump(2) << '\n';
        if (!out)
            return std::unexpected(SigchainError::resource("Failed writing report file: " + path));
        return {};
    }

} // namespace sigchain
