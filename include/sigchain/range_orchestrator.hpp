#pragma once

#include "object_store.hpp"
#include "parent_walker.hpp"
#include "report.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace sigchain
{

    /**
     * Drives verification of every commit a reference update introduces.
     *
     * The range is everything reachable from the new value minus what is
     * reachable from the old value, or from every other known ref when the
     * reference is being created. The first commit that cannot be verified
     * rejects the whole update.
     */
    class RangeOrchestrator
    {
    public:
        RangeOrchestrator(ObjectStore &objects, ParentTrustWalker &walker, std::string key_dir);

        /** Commits introduced by `update`, given a snapshot of known refs */
        Result<std::vector<std::string>> compute_range(const RefUpdate &update,
                                                       const std::vector<RefEntry> &known_refs);

        /** Exclusion set for `update` (old value, or all other refs on creation) */
        static std::vector<std::string> exclusion_set(const RefUpdate &update,
                                                      const std::vector<RefEntry> &known_refs);

        Result<PushReport> verify_push(const RefUpdate &update);

    private:
        /** Verify one commit; a rejection is written into report.failure */
        Result<void> verify_commit(const std::string &commit_id, PushReport &report);

        ObjectStore &objects_;
        ParentTrustWalker &walker_;
        std::string key_dir_;
    };

} // namespace sigchain
